#ifndef __PARAMETER_GRID_H
#define __PARAMETER_GRID_H 1

#include <vector>
#include <string>
#include <functional>
#include <cstddef>
#include <stdexcept>
#include <limits>

#include "WalkForwardHarness.h"
#include "ValidationException.h"

namespace oosvalidator
{
  /**
   * @brief Cartesian grid of named numeric dimensions.
   *
   * Points are numbered in canonical order: the first dimension added is the
   * outermost loop and the last dimension varies fastest. Grid search
   * depends on this order for its tie-break.
   */
  class ParameterGrid
  {
  public:
    ParameterGrid()
      : m_names(),
	m_values()
    {}

    ParameterGrid& addDimension(const std::string& name, const std::vector<double>& values)
    {
      if (values.empty())
	throw ConfigurationException("ParameterGrid: dimension '" + name + "' has no values");

      m_names.push_back(name);
      m_values.push_back(values);
      return *this;
    }

    std::size_t numDimensions() const
    {
      return m_values.size();
    }

    const std::string& dimensionName(std::size_t d) const
    {
      return m_names.at(d);
    }

    // Number of points; 0 for a grid without dimensions
    std::size_t size() const
    {
      if (m_values.empty())
	return 0;

      std::size_t n = 1;
      for (const auto& v : m_values)
	n *= v.size();
      return n;
    }

    std::vector<double> point(std::size_t index) const
    {
      if (index >= size())
	throw std::out_of_range("ParameterGrid::point: index " + std::to_string(index) +
				" outside a grid of " + std::to_string(size()) + " points");

      std::vector<double> p(m_values.size());
      for (std::size_t d = m_values.size(); d-- > 0; )
	{
	  const std::size_t extent = m_values[d].size();
	  p[d] = m_values[d][index % extent];
	  index /= extent;
	}
      return p;
    }

    std::vector<std::vector<double>> points() const
    {
      std::vector<std::vector<double>> all;
      const std::size_t n = size();
      all.reserve(n);
      for (std::size_t i = 0; i < n; ++i)
	all.push_back(point(i));
      return all;
    }

    // first, first + step, ... up to and including last
    static std::vector<double> integerRange(int first, int last, int step = 1)
    {
      if (step <= 0)
	throw ConfigurationException("ParameterGrid::integerRange: step must be positive");

      // Stepped in long long so last near INT_MAX cannot overflow
      std::vector<double> values;
      for (long long v = first; v <= last; v += step)
	values.push_back(static_cast<double>(v));
      return values;
    }

  private:
    std::vector<std::string>         m_names;
    std::vector<std::vector<double>> m_values;
  };

  /**
   * @brief In-sample score of one candidate and the trading state at the end
   * of the training window.
   */
  template <class State>
  struct CandidateScore
  {
    double criterion;
    State  finalState;
  };

  /**
   * @brief Exhaustive trainer: scores every candidate on the training window
   * and keeps the best.
   *
   * Candidates are tried in the order given; a later candidate replaces the
   * current best only when its criterion is strictly greater, so the first of
   * several tied candidates wins.
   */
  template <class Params, class State>
  class GridSearchTrainer
  {
  public:
    using Scorer = std::function<CandidateScore<State>(const SeriesWindow&, const Params&)>;
    // Called once per candidate, in search order, with its in-sample score
    using Observer = std::function<void(const Params&, const CandidateScore<State>&)>;

    GridSearchTrainer(std::vector<Params> candidates, Scorer scorer)
      : m_candidates(std::move(candidates)),
	m_scorer(std::move(scorer)),
	m_observer()
    {
      if (m_candidates.empty())
	throw ConfigurationException("GridSearchTrainer: no candidate parameters");
      if (!m_scorer)
	throw std::invalid_argument("GridSearchTrainer: scorer is empty");
    }

    void setObserver(Observer observer)
    {
      m_observer = std::move(observer);
    }

    const std::vector<Params>& candidates() const
    {
      return m_candidates;
    }

    TrainingResult<Params, State> operator()(const SeriesWindow& window) const
    {
      std::size_t bestIndex = 0;
      CandidateScore<State> best = m_scorer(window, m_candidates[0]);
      if (m_observer)
	m_observer(m_candidates[0], best);

      for (std::size_t i = 1; i < m_candidates.size(); ++i)
	{
	  CandidateScore<State> score = m_scorer(window, m_candidates[i]);
	  if (m_observer)
	    m_observer(m_candidates[i], score);

	  if (score.criterion > best.criterion)
	    {
	      best = std::move(score);
	      bestIndex = i;
	    }
	}

      return TrainingResult<Params, State>{m_candidates[bestIndex], best.finalState, best.criterion};
    }

  private:
    std::vector<Params> m_candidates;
    Scorer              m_scorer;
    Observer            m_observer;
  };
}

#endif
