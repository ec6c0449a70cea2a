#pragma once

#include <algorithm>
#include <cstddef>
#include <numeric>
#include <stdexcept>
#include <vector>

namespace oosvalidator
{
  /**
   * @brief In-sample, out-of-sample and bias figures from a StochasticBias run.
   */
  struct BiasEstimate
  {
    double isReturn = 0.0;
    double oosReturn = 0.0;
    double bias = 0.0;
  };

  /**
   * @brief Estimates training bias from the candidates visited by a random or
   * exhaustive parameter search.
   *
   * The search loop fills returns() with the per-case returns of each
   * candidate and calls process(). For every case i the tracker treats
   * total - returns[i] as the in-sample score of that candidate with case i
   * held out, keeps the best such score seen so far, and stores the held-out
   * return of the same candidate beside it. The (isBest[i], oos[i]) pair is
   * always replaced together.
   *
   * Collect only while candidates are generated blindly; switch collecting
   * off during any guided refinement. process() while idle does nothing.
   *
   * One tracker per search; the class is not thread safe.
   */
  class StochasticBias
  {
  public:
    explicit StochasticBias(std::size_t nReturns)
      : m_nReturns(nReturns),
	m_collecting(false),
	m_gotFirstCase(false),
	m_isBest(nReturns, 0.0),
	m_oos(nReturns, 0.0),
	m_returns(nReturns, 0.0)
    {
      if (nReturns < 2)
	throw std::invalid_argument("StochasticBias: at least two returns are required");
    }

    std::size_t numReturns() const
    {
      return m_nReturns;
    }

    void setCollecting(bool collect)
    {
      m_collecting = collect;
    }

    bool isCollecting() const
    {
      return m_collecting;
    }

    // Scratch area the criterion writes each candidate's case returns into.
    std::vector<double>& returns()
    {
      return m_returns;
    }

    const std::vector<double>& returns() const
    {
      return m_returns;
    }

    const std::vector<double>& isBest() const
    {
      return m_isBest;
    }

    const std::vector<double>& oos() const
    {
      return m_oos;
    }

    bool hasCandidates() const
    {
      return m_gotFirstCase;
    }

    void process()
    {
      if (!m_collecting)
	return;

      const double total = std::accumulate(m_returns.begin(), m_returns.end(), 0.0);

      if (!m_gotFirstCase)
	{
	  m_gotFirstCase = true;
	  for (std::size_t i = 0; i < m_nReturns; ++i)
	    {
	      m_isBest[i] = total - m_returns[i];
	      m_oos[i] = m_returns[i];
	    }
	  return;
	}

      for (std::size_t i = 0; i < m_nReturns; ++i)
	{
	  const double candidate = total - m_returns[i];
	  if (candidate > m_isBest[i])
	    {
	      m_isBest[i] = candidate;
	      m_oos[i] = m_returns[i];
	    }
	}
    }

    /**
     * @brief isReturn = sum(isBest) / (nReturns - 1), since each isBest[i]
     * sums nReturns - 1 cases; oosReturn = sum(oos); bias = isReturn - oosReturn.
     */
    BiasEstimate compute() const
    {
      BiasEstimate est;
      est.isReturn = std::accumulate(m_isBest.begin(), m_isBest.end(), 0.0) /
	static_cast<double>(m_nReturns - 1);
      est.oosReturn = std::accumulate(m_oos.begin(), m_oos.end(), 0.0);
      est.bias = est.isReturn - est.oosReturn;
      return est;
    }

    // Forget every candidate; the collecting flag is left as it is.
    void reset()
    {
      m_gotFirstCase = false;
      std::fill(m_isBest.begin(), m_isBest.end(), 0.0);
      std::fill(m_oos.begin(), m_oos.end(), 0.0);
      std::fill(m_returns.begin(), m_returns.end(), 0.0);
    }

  private:
    std::size_t         m_nReturns;
    bool                m_collecting;
    bool                m_gotFirstCase;
    std::vector<double> m_isBest;
    std::vector<double> m_oos;
    std::vector<double> m_returns;
  };
}
