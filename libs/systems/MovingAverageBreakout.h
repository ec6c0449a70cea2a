#ifndef __MOVING_AVERAGE_BREAKOUT_H
#define __MOVING_AVERAGE_BREAKOUT_H 1

#include <vector>
#include <string>
#include <cstddef>

#include "ParameterGrid.h"
#include "WalkForwardHarness.h"
#include "ValidationException.h"

namespace oosvalidator
{
  namespace systems
  {
    struct BreakoutParams
    {
      std::size_t lookback;
      double      threshold;   // fraction above the moving average, e.g. 0.03
    };

    inline bool operator==(const BreakoutParams& lhs, const BreakoutParams& rhs)
    {
      return lhs.lookback == rhs.lookback && lhs.threshold == rhs.threshold;
    }

    // 1 while long, 0 while flat
    using BreakoutPosition = int;

    /**
     * @brief Long-only moving-average breakout system on log prices.
     *
     * On decision bar i the system goes long when price[i] exceeds the
     * lookback-bar moving average by more than the threshold fraction, goes
     * flat when price[i] falls below the moving average and otherwise keeps
     * its position. The position taken on bar i earns price[i+1] - price[i].
     *
     * Training scores every (lookback, threshold) pair on the training window,
     * lookback 2..maxLookback in the outer loop and threshold 1..nThresholds
     * percent in the inner loop, by the mean return per bar in the market.
     * Every candidate makes its first decision on bar maxLookback - 1 of the
     * window so that all of them are scored over the same bars.
     */
    class MovingAverageBreakout
    {
    public:
      using Harness = WalkForwardHarness<BreakoutParams, BreakoutPosition>;

      explicit MovingAverageBreakout(std::size_t maxLookback, unsigned int nThresholds = 10)
	: m_maxLookback(maxLookback),
	  m_nThresholds(nThresholds)
      {
	if (m_maxLookback < 2)
	  throw ConfigurationException("MovingAverageBreakout: maximum lookback must be at least 2");
	if (m_nThresholds == 0)
	  throw ConfigurationException("MovingAverageBreakout: at least one threshold is required");
      }

      std::size_t maxLookback() const
      {
	return m_maxLookback;
      }

      // Shortest training window that leaves at least one scored bar
      std::size_t minTrainingLength() const
      {
	return m_maxLookback + 1;
      }

      std::vector<BreakoutParams> candidates() const
      {
	ParameterGrid grid;
	grid.addDimension("lookback",
			  ParameterGrid::integerRange(2, static_cast<int>(m_maxLookback)))
	  .addDimension("threshold",
			ParameterGrid::integerRange(1, static_cast<int>(m_nThresholds)));

	std::vector<BreakoutParams> params;
	params.reserve(grid.size());
	for (const auto& p : grid.points())
	  params.push_back(BreakoutParams{static_cast<std::size_t>(p[0]), 0.01 * p[1]});

	return params;
      }

      /**
       * @brief In-sample score of one candidate on a training window.
       *
       * The position starts flat at the beginning of the window. The returned
       * state is the position held after the last decision, which the
       * evaluator continues from.
       */
      CandidateScore<BreakoutPosition> score(const SeriesWindow& window, const BreakoutParams& params) const
      {
	checkTrainingWindow(window);
	if (params.lookback < 1 || params.lookback > m_maxLookback)
	  throw ConfigurationException("MovingAverageBreakout: lookback " + std::to_string(params.lookback) +
				       " outside 1.." + std::to_string(m_maxLookback));

	const std::size_t lookback = params.lookback;
	const double trigger = 1.0 + params.threshold;

	double totalReturn = 0.0;
	int nTrades = 0;
	BreakoutPosition position = 0;
	double maSum = 0.0;

	for (std::size_t i = m_maxLookback - 1; i + 1 < window.length(); ++i)
	  {
	    if (i == m_maxLookback - 1)
	      {
		maSum = 0.0;
		for (std::size_t j = i + 1 - lookback; j <= i; ++j)
		  maSum += window[j];
	      }
	    else
	      maSum += window[i] - window[i - lookback];

	    const double ma = maSum / static_cast<double>(lookback);
	    position = nextPosition(position, window[i], ma, trigger);

	    if (position)
	      {
		++nTrades;
		totalReturn += window[i + 1] - window[i];
	      }
	  }

	return CandidateScore<BreakoutPosition>{totalReturn / (nTrades + 1.0e-30), position};
      }

      TrainingResult<BreakoutParams, BreakoutPosition> train(const SeriesWindow& window) const
      {
	GridSearchTrainer<BreakoutParams, BreakoutPosition>
	  search(candidates(), [this](const SeriesWindow& w, const BreakoutParams& p) {
	    return score(w, p);
	  });

	return search(window);
      }

      /**
       * @brief Out-of-sample returns of frozen parameters on a test window.
       *
       * Decisions run from the bar before the window through the
       * second-to-last bar of the window, starting from the position the
       * training pass ended in. The moving average is seeded from the bars
       * preceding the window.
       *
       * CompletedTrades records price[close] - price[open] for each trade
       * closed inside the window; a trade still open on the final decision
       * is closed at the last bar of the window.
       */
      EvaluationResult<BreakoutPosition> evaluate(const SeriesWindow& test,
						  const BreakoutParams& params,
						  const BreakoutPosition& priorPosition,
						  ReturnType type) const
      {
	if (params.lookback < 1 || test.start() < params.lookback)
	  throw ConfigurationException("MovingAverageBreakout: test window at bar " +
				       std::to_string(test.start()) +
				       " has too little history for lookback " +
				       std::to_string(params.lookback));

	EvaluationResult<BreakoutPosition> out;
	out.finalState = priorPosition;
	if (test.length() == 0)
	  return out;

	const std::size_t first = test.start() - 1;
	const std::size_t last = test.end() - 2;
	const std::size_t lookback = params.lookback;
	const double trigger = 1.0 + params.threshold;

	BreakoutPosition position = priorPosition;
	BreakoutPosition previous = 0;
	double openPrice = 0.0;
	double maSum = 0.0;

	for (std::size_t i = first; i <= last; ++i)
	  {
	    if (i == first)
	      {
		maSum = 0.0;
		for (std::size_t j = i + 1 - lookback; j <= i; ++j)
		  maSum += test.at(j);
	      }
	    else
	      maSum += test.at(i) - test.at(i - lookback);

	    const double price = test.at(i);
	    const double ma = maSum / static_cast<double>(lookback);
	    position = nextPosition(position, price, ma, trigger);

	    const double ret = position ? test.at(i + 1) - price : 0.0;

	    switch (type)
	      {
	      case ReturnType::AllBars:
		out.returns.push_back(ret);
		break;

	      case ReturnType::OpenPosition:
		if (position)
		  out.returns.push_back(ret);
		break;

	      case ReturnType::CompletedTrades:
		if (position && !previous)
		  openPrice = price;
		else if (previous && !position)
		  out.returns.push_back(price - openPrice);
		else if (position && i == last)
		  out.returns.push_back(test.at(i + 1) - openPrice);
		break;
	      }

	    previous = position;
	  }

	out.finalState = position;
	return out;
      }

      Harness::Trainer trainer() const
      {
	return [this](const SeriesWindow& w) { return train(w); };
      }

      Harness::Evaluator evaluator() const
      {
	return [this](const SeriesWindow& w, const BreakoutParams& p,
		      const BreakoutPosition& prior, ReturnType type) {
	  return evaluate(w, p, prior, type);
	};
      }

    private:
      static BreakoutPosition nextPosition(BreakoutPosition current, double price, double ma, double trigger)
      {
	if (price > trigger * ma)
	  return 1;
	if (price < ma)
	  return 0;
	return current;
      }

      void checkTrainingWindow(const SeriesWindow& window) const
      {
	if (window.length() < minTrainingLength())
	  throw ConfigurationException("MovingAverageBreakout: training window of " +
				       std::to_string(window.length()) +
				       " bars is too short for maximum lookback " +
				       std::to_string(m_maxLookback));
      }

    private:
      std::size_t  m_maxLookback;
      unsigned int m_nThresholds;
    };
  }
}

#endif
