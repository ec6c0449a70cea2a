#include <catch2/catch_test_macros.hpp>
#include <vector>
#include <limits>
#include <utility>
#include <stdexcept>

#include "ParameterGrid.h"

using namespace oosvalidator;

TEST_CASE("ParameterGrid: last dimension varies fastest", "[grid]")
{
  ParameterGrid grid;
  grid.addDimension("lookback", {2.0, 3.0, 4.0})
    .addDimension("threshold", {0.01, 0.02});

  REQUIRE(grid.numDimensions() == 2);
  REQUIRE(grid.dimensionName(0) == "lookback");
  REQUIRE(grid.dimensionName(1) == "threshold");
  REQUIRE(grid.size() == 6);

  const auto pts = grid.points();
  REQUIRE(pts.size() == 6);
  REQUIRE(pts[0] == std::vector<double>{2.0, 0.01});
  REQUIRE(pts[1] == std::vector<double>{2.0, 0.02});
  REQUIRE(pts[2] == std::vector<double>{3.0, 0.01});
  REQUIRE(pts[5] == std::vector<double>{4.0, 0.02});

  REQUIRE_THROWS_AS(grid.point(6), std::out_of_range);
  REQUIRE_THROWS_AS(grid.dimensionName(2), std::out_of_range);
}

TEST_CASE("ParameterGrid: empty grids and bad dimensions", "[grid]")
{
  ParameterGrid grid;
  REQUIRE(grid.size() == 0);
  REQUIRE(grid.points().empty());
  REQUIRE_THROWS_AS(grid.addDimension("x", {}), ConfigurationException);
}

TEST_CASE("ParameterGrid: integer ranges are inclusive", "[grid]")
{
  REQUIRE(ParameterGrid::integerRange(1, 5) == std::vector<double>{1, 2, 3, 4, 5});
  REQUIRE(ParameterGrid::integerRange(2, 9, 3) == std::vector<double>{2, 5, 8});
  REQUIRE(ParameterGrid::integerRange(4, 4) == std::vector<double>{4});
  REQUIRE(ParameterGrid::integerRange(5, 4).empty());
  REQUIRE_THROWS_AS(ParameterGrid::integerRange(1, 5, 0), ConfigurationException);

  SECTION("Ranges ending at INT_MAX stop after the last value")
  {
    const int top = std::numeric_limits<int>::max();
    REQUIRE(ParameterGrid::integerRange(top - 2, top) ==
	    std::vector<double>{top - 2.0, top - 1.0, static_cast<double>(top)});
    REQUIRE(ParameterGrid::integerRange(top - 5, top, 4) ==
	    std::vector<double>{top - 5.0, top - 1.0});
    REQUIRE(ParameterGrid::integerRange(top, top, std::numeric_limits<int>::max()) ==
	    std::vector<double>{static_cast<double>(top)});
  }
}

TEST_CASE("GridSearchTrainer: best candidate with first-wins ties", "[grid][trainer]")
{
  const std::vector<double> series(20, 1.0);
  const SeriesWindow window(series, 5, 10);

  // score by candidate value: {1, 3, 3, 2}; state is the candidate's position
  const std::vector<int> candidates = {10, 30, 31, 20};
  GridSearchTrainer<int, int>::Scorer scorer = [](const SeriesWindow& w, const int& p) {
    REQUIRE(w.start() == 5);
    return CandidateScore<int>{static_cast<double>(p / 10), p};
  };

  GridSearchTrainer<int, int> trainer(candidates, scorer);
  std::vector<std::pair<int, double>> observed;
  trainer.setObserver([&observed](const int& p, const CandidateScore<int>& s) {
    observed.emplace_back(p, s.criterion);
  });

  const auto result = trainer(window);
  REQUIRE(result.params == 30);
  REQUIRE(result.finalState == 30);
  REQUIRE(result.criterion == 3.0);

  // every candidate in search order, including the losers
  REQUIRE(observed == std::vector<std::pair<int, double>>{{10, 1.0}, {30, 3.0}, {31, 3.0}, {20, 2.0}});
}

TEST_CASE("GridSearchTrainer: configuration errors", "[grid][trainer]")
{
  GridSearchTrainer<int, int>::Scorer scorer = [](const SeriesWindow&, const int& p) {
    return CandidateScore<int>{static_cast<double>(p), p};
  };

  REQUIRE_THROWS_AS((GridSearchTrainer<int, int>(std::vector<int>(), scorer)), ConfigurationException);
  REQUIRE_THROWS_AS((GridSearchTrainer<int, int>(std::vector<int>{1},
						 GridSearchTrainer<int, int>::Scorer())),
		    std::invalid_argument);

  GridSearchTrainer<int, int> single(std::vector<int>{7}, scorer);
  REQUIRE(single.candidates().size() == 1);
}

TEST_CASE("GridSearchTrainer: drives a walk forward", "[grid][trainer][walkforward]")
{
  std::vector<double> series(30);
  for (std::size_t i = 0; i < series.size(); ++i)
    series[i] = static_cast<double>(i);

  // Criterion is the window's last bar scaled by the candidate; candidate 2 always wins
  GridSearchTrainer<int, double> trainer(std::vector<int>{1, 2}, [](const SeriesWindow& w, const int& p) {
    const double last = w[w.length() - 1];
    return CandidateScore<double>{p * last, last};
  });

  WalkForwardHarness<int, double>::Evaluator evaluator = [](const SeriesWindow& w, const int& p,
							      const double& prior, ReturnType) {
    EvaluationResult<double> out;
    out.returns.push_back(p * prior);
    out.finalState = prior;
    return out;
  };

  const auto result = WalkForwardHarness<int, double>(10, 10).run(series, trainer, evaluator);
  REQUIRE(result.numFolds() == 2);
  REQUIRE(result.folds[0].params == 2);
  REQUIRE(result.pooledReturns == std::vector<double>{18.0, 38.0});
}
