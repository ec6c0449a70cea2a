#ifndef __WALK_FORWARD_HARNESS_H
#define __WALK_FORWARD_HARNESS_H 1

#include <vector>
#include <functional>
#include <string>
#include <cstddef>
#include <stdexcept>
#include <algorithm>

#include "ValidationException.h"

namespace oosvalidator
{
  /**
   * @brief Which bars an evaluator turns into returns.
   *
   * AllBars: every bar of the test window, zero while flat.
   * OpenPosition: only bars on which a position is held.
   * CompletedTrades: one return per closed trade; a position still open at
   * the end of the test window is closed on its last bar.
   */
  enum class ReturnType
    {
      AllBars,
      OpenPosition,
      CompletedTrades
    };

  inline std::string returnTypeName(ReturnType type)
  {
    switch (type)
      {
      case ReturnType::AllBars:
	return "all-bars";
      case ReturnType::OpenPosition:
	return "open-position";
      case ReturnType::CompletedTrades:
	return "completed-trades";
      }
    return "unknown";
  }

  /**
   * @brief Read-only view of the bars [start, start + length) of a series.
   *
   * Relative access with operator[] stays inside the window. Trading
   * systems need the bars before the window to seed their indicators, so
   * at() reads any bar of the underlying series by absolute index.
   */
  class SeriesWindow
  {
  public:
    SeriesWindow(const std::vector<double>& series, std::size_t start, std::size_t length)
      : m_series(&series),
	m_start(start),
	m_length(length)
    {
      if (start > series.size() || length > series.size() - start)
	throw std::out_of_range("SeriesWindow: window [" + std::to_string(start) + ", " +
				std::to_string(start + length) + ") exceeds a series of " +
				std::to_string(series.size()) + " bars");
    }

    std::size_t start() const
    {
      return m_start;
    }

    std::size_t length() const
    {
      return m_length;
    }

    // One past the last bar of the window, as an absolute index
    std::size_t end() const
    {
      return m_start + m_length;
    }

    double operator[](std::size_t offset) const
    {
      return (*m_series)[m_start + offset];
    }

    double at(std::size_t absoluteIndex) const
    {
      return m_series->at(absoluteIndex);
    }

    const std::vector<double>& series() const
    {
      return *m_series;
    }

  private:
    const std::vector<double>* m_series;
    std::size_t m_start;
    std::size_t m_length;
  };

  /**
   * @brief What a trainer hands to the harness: the chosen parameters, the
   * trading state at the end of the training window and the criterion value
   * the parameters achieved in sample.
   */
  template <class Params, class State>
  struct TrainingResult
  {
    Params params;
    State  finalState;
    double criterion;
  };

  template <class State>
  struct EvaluationResult
  {
    std::vector<double> returns;
    State               finalState;
  };

  // Absolute bar geometry of one fold
  struct FoldWindow
  {
    std::size_t trainStart;
    std::size_t trainLength;
    std::size_t testStart;
    std::size_t testLength;
  };

  /**
   * @brief One walk-forward step: the training window, the frozen parameters
   * chosen on it and the out-of-sample returns they produced.
   */
  template <class Params>
  struct WalkForwardFold
  {
    std::size_t         trainStart;
    std::size_t         trainLength;
    std::size_t         testStart;
    std::size_t         testLength;
    Params              params;
    double              criterion;
    std::vector<double> returns;
  };

  template <class Params>
  struct WalkForwardResult
  {
    std::vector<WalkForwardFold<Params>> folds;
    std::vector<double>                  pooledReturns;   // fold returns in fold order

    std::size_t numFolds() const
    {
      return folds.size();
    }
  };

  // The same folds evaluated under each return type
  template <class Params>
  struct WalkForwardReturnSet
  {
    WalkForwardResult<Params> allBars;
    WalkForwardResult<Params> openPosition;
    WalkForwardResult<Params> completedTrades;

    const WalkForwardResult<Params>& byType(ReturnType type) const
    {
      switch (type)
	{
	case ReturnType::AllBars:
	  return allBars;
	case ReturnType::OpenPosition:
	  return openPosition;
	case ReturnType::CompletedTrades:
	  return completedTrades;
	}
      throw std::invalid_argument("WalkForwardReturnSet::byType: unknown return type");
    }
  };

  /**
   * @brief Rolling train/test driver.
   *
   * Starting at bar 0, each fold trains on [start, start + nTrain) and
   * evaluates the frozen parameters on the following
   * min(nTest, N - start - nTrain) bars. The trainer's end-of-training state
   * is handed to the evaluator so the first test decision continues the last
   * training decision. start then advances by the number of test bars used,
   * and the walk stops once start + nTrain reaches N. Test windows are
   * contiguous and cover [nTrain, N); only the final one may be short.
   *
   * @tparam Params parameter type chosen by the trainer
   * @tparam State  trading state carried from training into testing
   */
  template <class Params, class State>
  class WalkForwardHarness
  {
  public:
    using Trainer = std::function<TrainingResult<Params, State>(const SeriesWindow&)>;
    using Evaluator = std::function<EvaluationResult<State>(const SeriesWindow&,
							    const Params&,
							    const State&,
							    ReturnType)>;

    WalkForwardHarness(std::size_t nTrain, std::size_t nTest)
      : m_nTrain(nTrain),
	m_nTest(nTest)
    {
      if (m_nTrain == 0)
	throw ConfigurationException("WalkForwardHarness: training window must be at least one bar");
      if (m_nTest == 0)
	throw ConfigurationException("WalkForwardHarness: test window must be at least one bar");
    }

    std::size_t trainLength() const
    {
      return m_nTrain;
    }

    std::size_t testLength() const
    {
      return m_nTest;
    }

    /**
     * @brief The fold windows for a series of seriesLength bars.
     *
     * @throws ConfigurationException if nTrain + nTest exceeds the series
     */
    std::vector<FoldWindow> planFolds(std::size_t seriesLength) const
    {
      if (m_nTrain + m_nTest > seriesLength)
	throw ConfigurationException("WalkForwardHarness: training (" + std::to_string(m_nTrain) +
				     ") plus test (" + std::to_string(m_nTest) +
				     ") bars exceed the series length " + std::to_string(seriesLength));

      std::vector<FoldWindow> windows;
      std::size_t start = 0;
      while (start + m_nTrain < seriesLength)
	{
	  const std::size_t testStart = start + m_nTrain;
	  const std::size_t n = std::min(m_nTest, seriesLength - testStart);
	  windows.push_back(FoldWindow{start, m_nTrain, testStart, n});
	  start += n;
	}

      return windows;
    }

    WalkForwardResult<Params> run(const std::vector<double>& series,
				  const Trainer& trainer,
				  const Evaluator& evaluator,
				  ReturnType returnType = ReturnType::AllBars) const
    {
      checkCallables(trainer, evaluator);
      const std::vector<FoldWindow> windows = planFolds(series.size());

      WalkForwardResult<Params> result;
      result.folds.reserve(windows.size());

      for (const FoldWindow& w : windows)
	{
	  const TrainingResult<Params, State> trained =
	    trainer(SeriesWindow(series, w.trainStart, w.trainLength));

	  EvaluationResult<State> evaluated =
	    evaluator(SeriesWindow(series, w.testStart, w.testLength),
		      trained.params, trained.finalState, returnType);

	  appendFold(result, w, trained, std::move(evaluated.returns));
	}

      return result;
    }

    /**
     * @brief Train once per fold and evaluate the frozen parameters under
     * every return type, each starting from the same end-of-training state.
     */
    WalkForwardReturnSet<Params> runAllReturnTypes(const std::vector<double>& series,
						   const Trainer& trainer,
						   const Evaluator& evaluator) const
    {
      checkCallables(trainer, evaluator);
      const std::vector<FoldWindow> windows = planFolds(series.size());

      WalkForwardReturnSet<Params> result;

      for (const FoldWindow& w : windows)
	{
	  const TrainingResult<Params, State> trained =
	    trainer(SeriesWindow(series, w.trainStart, w.trainLength));
	  const SeriesWindow testWindow(series, w.testStart, w.testLength);

	  appendFold(result.allBars, w, trained,
		     evaluator(testWindow, trained.params, trained.finalState, ReturnType::AllBars).returns);
	  appendFold(result.openPosition, w, trained,
		     evaluator(testWindow, trained.params, trained.finalState, ReturnType::OpenPosition).returns);
	  appendFold(result.completedTrades, w, trained,
		     evaluator(testWindow, trained.params, trained.finalState, ReturnType::CompletedTrades).returns);
	}

      return result;
    }

  private:
    static void checkCallables(const Trainer& trainer, const Evaluator& evaluator)
    {
      if (!trainer)
	throw std::invalid_argument("WalkForwardHarness: trainer is empty");
      if (!evaluator)
	throw std::invalid_argument("WalkForwardHarness: evaluator is empty");
    }

    static void appendFold(WalkForwardResult<Params>& result,
			   const FoldWindow& w,
			   const TrainingResult<Params, State>& trained,
			   std::vector<double> returns)
    {
      result.pooledReturns.insert(result.pooledReturns.end(), returns.begin(), returns.end());
      result.folds.push_back(WalkForwardFold<Params>{w.trainStart, w.trainLength,
						     w.testStart, w.testLength,
						     trained.params, trained.criterion,
						     std::move(returns)});
    }

  private:
    std::size_t m_nTrain;
    std::size_t m_nTest;
  };

  /**
   * @brief One-call walk forward over a series.
   */
  template <class Params, class State>
  inline WalkForwardResult<Params>
  walkForward(const std::vector<double>& series,
	      std::size_t nTrain,
	      std::size_t nTest,
	      const typename WalkForwardHarness<Params, State>::Trainer& trainer,
	      const typename WalkForwardHarness<Params, State>::Evaluator& evaluator,
	      ReturnType returnType = ReturnType::AllBars)
  {
    return WalkForwardHarness<Params, State>(nTrain, nTest).run(series, trainer, evaluator, returnType);
  }
}

#endif
