#ifndef __CSCV_OVERFITTING_H
#define __CSCV_OVERFITTING_H 1

#include <vector>
#include <cmath>
#include <cstdint>
#include <cstddef>
#include <limits>
#include <memory>
#include <string>

#include "PerformanceCriteria.h"
#include "ValidationException.h"
#include "ParallelExecutors.h"
#include "ParallelFor.h"

namespace oosvalidator
{
  /**
   * @brief Contiguous case range [index, index + length) of a CSCV partition.
   */
  struct CscvBlock
  {
    std::size_t index;
    std::size_t length;
  };

  /**
   * @brief Split nCases into nBlocks contiguous blocks, left to right.
   *
   * Block i receives ceil(remaining cases / remaining blocks), so the lengths
   * sum to nCases and no two lengths differ by more than one.
   *
   * @throws ConfigurationException if nBlocks is 0 or exceeds nCases
   */
  inline std::vector<CscvBlock> partitionCases(std::size_t nCases, std::size_t nBlocks)
  {
    if (nBlocks == 0)
      throw ConfigurationException("partitionCases: number of blocks must be positive");
    if (nCases < nBlocks)
      throw ConfigurationException("partitionCases: " + std::to_string(nCases) +
				   " cases cannot fill " + std::to_string(nBlocks) + " blocks");

    std::vector<CscvBlock> blocks;
    blocks.reserve(nBlocks);

    std::size_t start = 0;
    for (std::size_t i = 0; i < nBlocks; ++i)
      {
	const std::size_t remainingCases = nCases - start;
	const std::size_t remainingBlocks = nBlocks - i;
	const std::size_t length = (remainingCases + remainingBlocks - 1) / remainingBlocks;
	blocks.push_back(CscvBlock{start, length});
	start += length;
      }

    return blocks;
  }

  /**
   * @brief Walks every assignment of nBlocks blocks to train (true) and test
   * (false) with exactly nBlocks/2 blocks on each side.
   *
   * Starts with the first half in train. next() finds the leftmost train
   * block whose right neighbour is a test block, swaps the pair, and packs
   * the train blocks that were left of the swap back to the far left. When
   * no train block is followed by a test block, every one of the
   * C(nBlocks, nBlocks/2) combinations has been produced exactly once.
   */
  class CombinationEnumerator
  {
  public:
    explicit CombinationEnumerator(std::size_t nBlocks)
      : m_flags(nBlocks, false)
    {
      if (nBlocks == 0 || (nBlocks % 2) != 0)
	throw ConfigurationException("CombinationEnumerator: number of blocks must be a positive even number");

      for (std::size_t i = 0; i < nBlocks / 2; ++i)
	m_flags[i] = true;
    }

    const std::vector<bool>& flags() const
    {
      return m_flags;
    }

    // Advance to the next combination; false once enumeration is complete.
    bool next()
    {
      const std::size_t nBlocks = m_flags.size();
      std::size_t trainSeen = 0;

      for (std::size_t ir = 0; ir + 1 < nBlocks; ++ir)
	{
	  if (!m_flags[ir])
	    continue;

	  ++trainSeen;
	  if (m_flags[ir + 1])
	    continue;

	  m_flags[ir] = false;
	  m_flags[ir + 1] = true;

	  // trainSeen - 1 train blocks lived left of ir; repack them at 0..
	  std::size_t toPlace = trainSeen - 1;
	  for (std::size_t i = 0; i < ir; ++i)
	    {
	      m_flags[i] = toPlace > 0;
	      if (toPlace > 0)
		--toPlace;
	    }
	  return true;
	}

      return false;
    }

  private:
    std::vector<bool> m_flags;
  };

  /**
   * @brief Outcome of one CSCV run.
   */
  struct CscvResult
  {
    double              probability = 0.0;    // votes / combinations
    std::size_t         combinations = 0;
    std::size_t         votes = 0;            // combinations with relative rank <= 0.5
    std::vector<double> relativeRanks;        // per combination, enumeration order
    std::vector<double> logits;               // log(w / (1 - w)) of each relative rank
    std::vector<std::size_t> inSampleBest;    // winning system per combination
  };

  /**
   * @brief Combinatorially symmetric cross validation estimate of the
   * probability that the in-sample best of many competing systems performs
   * at or below the median out of sample.
   *
   * The returns matrix is nSystems rows by nCases columns, case index
   * changing fastest. For every train/test split of the blocks the criterion
   * is evaluated per system on the concatenated train cases and on the
   * concatenated test cases. The first system with the highest in-sample
   * criterion is the winner, and its relative rank out of sample is
   *
   *     #{ j : j == best or oos[best] >= oos[j] } / (nSystems + 1)
   *
   * A rank of at most 0.5 counts as a vote. High probabilities signal
   * overfitting.
   *
   * Combinations are enumerated serially in batches of batchSize() and each
   * batch is evaluated in parallel through the Executor, so the split flags
   * held at any time are bounded by the batch. The per-combination vectors of
   * CscvResult still grow with C(nBlocks, nBlocks/2): about 185 thousand
   * entries at 20 blocks but 155 million at 30, so keep nBlocks at 20 or
   * below and call computeProbability() when only the probability is wanted.
   */
  template <class Executor = concurrency::SingleThreadExecutor>
  class CscvEstimator
  {
  public:
    // Odd block counts are rounded down to the next even number.
    explicit CscvEstimator(std::size_t nBlocks)
      : CscvEstimator(nBlocks, std::make_shared<Executor>())
    {}

    CscvEstimator(std::size_t nBlocks, std::shared_ptr<Executor> executor)
      : m_nBlocks((nBlocks / 2) * 2),
	m_exec(std::move(executor)),
	m_batchSize(DefaultBatchSize)
    {
      if (m_nBlocks == 0)
	throw ConfigurationException("CscvEstimator: need at least two blocks (got " +
				     std::to_string(nBlocks) + ")");
      if (!m_exec)
	throw std::invalid_argument("CscvEstimator: executor must not be null");
    }

    static constexpr std::size_t DefaultBatchSize = 4096;

    std::size_t numBlocks() const
    {
      return m_nBlocks;
    }

    std::size_t batchSize() const
    {
      return m_batchSize;
    }

    void setBatchSize(std::size_t batch)
    {
      if (batch == 0)
	throw std::invalid_argument("CscvEstimator: batch size must be positive");
      if (batch > std::numeric_limits<uint32_t>::max())
	throw std::invalid_argument("CscvEstimator: batch size exceeds the executor index range");
      m_batchSize = batch;
    }

    double computeProbability(const std::vector<double>& returns,
			      std::size_t nSystems,
			      std::size_t nCases,
			      const CriterionFn& criterion) const
    {
      return run(returns, nSystems, nCases, criterion, false).probability;
    }

    CscvResult compute(const std::vector<double>& returns,
		       std::size_t nSystems,
		       std::size_t nCases,
		       const CriterionFn& criterion) const
    {
      return run(returns, nSystems, nCases, criterion, true);
    }

  private:
    // keepDetail false leaves the per-combination vectors of the result empty
    CscvResult run(const std::vector<double>& returns,
		   std::size_t nSystems,
		   std::size_t nCases,
		   const CriterionFn& criterion,
		   bool keepDetail) const
    {
      if (!criterion)
	throw std::invalid_argument("CscvEstimator: criterion function is empty");
      if (nSystems == 0)
	throw ConfigurationException("CscvEstimator: at least one system is required");
      if (returns.size() != nSystems * nCases)
	throw ConfigurationException("CscvEstimator: returns matrix has " + std::to_string(returns.size()) +
				     " entries, expected " + std::to_string(nSystems) + " x " +
				     std::to_string(nCases));

      const std::vector<CscvBlock> blocks = partitionCases(nCases, m_nBlocks);

      CscvResult result;
      CombinationEnumerator enumerator(m_nBlocks);
      std::vector<std::vector<bool>> batch;
      batch.reserve(m_batchSize);
      bool more = true;

      while (more)
	{
	  batch.clear();
	  do
	    {
	      batch.push_back(enumerator.flags());
	      more = enumerator.next();
	    }
	  while (more && batch.size() < m_batchSize);

	  std::vector<double> ranks(batch.size());
	  std::vector<std::size_t> winners(batch.size());

	  concurrency::parallel_for(static_cast<uint32_t>(batch.size()), *m_exec,
	    [&](uint32_t c) {
	      evaluateCombination(returns, nSystems, nCases, blocks, batch[c], criterion,
				  ranks[c], winners[c]);
	    });

	  for (std::size_t c = 0; c < batch.size(); ++c)
	    {
	      const double w = ranks[c];
	      if (w <= 0.5)
		++result.votes;

	      if (keepDetail)
		{
		  result.relativeRanks.push_back(w);
		  result.logits.push_back(std::log(w / (1.0 - w)));
		  result.inSampleBest.push_back(winners[c]);
		}
	    }

	  result.combinations += batch.size();
	}

      result.probability = static_cast<double>(result.votes) /
	static_cast<double>(result.combinations);
      return result;
    }

    static void evaluateCombination(const std::vector<double>& returns,
				    std::size_t nSystems,
				    std::size_t nCases,
				    const std::vector<CscvBlock>& blocks,
				    const std::vector<bool>& trainFlags,
				    const CriterionFn& criterion,
				    double& rankOut,
				    std::size_t& bestOut)
    {
      std::vector<double> isCrit(nSystems);
      std::vector<double> oosCrit(nSystems);
      std::vector<double> work;
      work.reserve(nCases);

      for (std::size_t sys = 0; sys < nSystems; ++sys)
	{
	  const double* row = returns.data() + sys * nCases;

	  gather(row, blocks, trainFlags, true, work);
	  isCrit[sys] = criterion(work);

	  gather(row, blocks, trainFlags, false, work);
	  oosCrit[sys] = criterion(work);
	}

      std::size_t best = 0;
      for (std::size_t sys = 1; sys < nSystems; ++sys)
	if (isCrit[sys] > isCrit[best])
	  best = sys;

      std::size_t atOrBelow = 0;
      for (std::size_t sys = 0; sys < nSystems; ++sys)
	if (sys == best || oosCrit[best] >= oosCrit[sys])
	  ++atOrBelow;

      rankOut = static_cast<double>(atOrBelow) / static_cast<double>(nSystems + 1);
      bestOut = best;
    }

    static void gather(const double* row,
		       const std::vector<CscvBlock>& blocks,
		       const std::vector<bool>& trainFlags,
		       bool wantTrain,
		       std::vector<double>& out)
    {
      out.clear();
      for (std::size_t b = 0; b < blocks.size(); ++b)
	if (trainFlags[b] == wantTrain)
	  out.insert(out.end(), row + blocks[b].index, row + blocks[b].index + blocks[b].length);
    }

  private:
    std::size_t               m_nBlocks;
    std::shared_ptr<Executor> m_exec;
    std::size_t               m_batchSize;
  };

  /**
   * @brief One-shot CSCV probability on the calling thread.
   */
  inline double cscvProbability(const std::vector<double>& returns,
				std::size_t nSystems,
				std::size_t nCases,
				std::size_t nBlocks,
				const CriterionFn& criterion)
  {
    CscvEstimator<> estimator(nBlocks);
    return estimator.computeProbability(returns, nSystems, nCases, criterion);
  }
}

#endif
