#include "classification/core/errors.hpp"
#include "classification/core/propagation.hpp"
#include "classification/core/uncertainty.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace geolabel::classification::core {
namespace gtest {

static std::shared_ptr<const FeatureTable> makeTable(const int count) {
	std::vector<SegmentRow> rows;
	for (int i = 1; i <= count; ++i) {
		rows.push_back({i, "", {static_cast<double>(i)}});
	}
	return std::make_shared<const FeatureTable>(std::vector<std::string>{"x"}, std::move(rows));
}

static std::vector<Prediction> predictionsWithEntropy(const std::vector<std::pair<SegmentId, double>>& values) {
	std::vector<Prediction> out;
	for (const auto& [id, entropy]: values) {
		out.push_back({id, "water", {0.5, 0.5}, entropy});
	}
	return out;
}

TEST(UncertaintyUnit, Entropy_Bounds) {
	EXPECT_DOUBLE_EQ(UncertaintySelector::entropy({1.0, 0.0, 0.0}), 0.0);
	EXPECT_NEAR(UncertaintySelector::entropy({0.25, 0.25, 0.25, 0.25}), 1.0, 1e-12);
	EXPECT_NEAR(UncertaintySelector::entropy({0.5, 0.5, 0.0}), std::log(2.0) / std::log(3.0), 1e-12);

	const double h = UncertaintySelector::entropy({0.7, 0.2, 0.1});
	EXPECT_GT(h, 0.0);
	EXPECT_LT(h, 1.0);
}

TEST(UncertaintyUnit, Entropy_SingleClassIsZero) {
	EXPECT_DOUBLE_EQ(UncertaintySelector::entropy({1.0}), 0.0);
	EXPECT_DOUBLE_EQ(UncertaintySelector::entropy({}), 0.0);
}

TEST(UncertaintyUnit, Entropy_RenormalisesInput) {
	EXPECT_NEAR(UncertaintySelector::entropy({2.0, 2.0}), 1.0, 1e-12);
	EXPECT_NEAR(UncertaintySelector::entropy({0.5 + 1e-15, 0.5}), 1.0, 1e-9);
	EXPECT_DOUBLE_EQ(UncertaintySelector::entropy({0.0, 0.0}), 0.0);
}

TEST(UncertaintyUnit, Rank_DescendingWithIdTieBreak) {
	auto table = makeTable(6);
	LabelStore labels(table);
	const UncertaintySelector selector;

	const auto predictions = predictionsWithEntropy({{1, 0.3}, {2, 0.9}, {3, 0.5}, {4, 0.9}, {5, 0.5}, {6, 0.1}});
	const std::vector<RankedSegment> ranking = selector.rank(*table, predictions, labels);

	std::vector<SegmentId> ids;
	for (const RankedSegment& r: ranking) {
		ids.push_back(r.id);
	}
	EXPECT_EQ(ids, (std::vector<SegmentId>{2, 4, 3, 5, 1, 6}));

	// Same input, same order.
	const std::vector<RankedSegment> again = selector.rank(*table, predictions, labels);
	ASSERT_EQ(again.size(), ranking.size());
	for (std::size_t i = 0; i < ranking.size(); ++i) {
		EXPECT_EQ(again[i].id, ranking[i].id);
	}
}

TEST(UncertaintyUnit, Rank_ExcludesManualLabels) {
	auto table = makeTable(4);
	LabelStore labels(table);
	labels.setManual(2, "water", "#0000ff");
	const UncertaintySelector selector;

	const auto predictions = predictionsWithEntropy({{1, 0.3}, {2, 0.9}, {3, 0.5}, {4, 0.7}});

	const auto excluded = selector.rank(*table, predictions, labels);
	ASSERT_EQ(excluded.size(), 3u);
	EXPECT_EQ(excluded.front().id, 4);

	const auto included = selector.rank(*table, predictions, labels, false);
	ASSERT_EQ(included.size(), 4u);
	EXPECT_EQ(included.front().id, 2);
}

TEST(UncertaintyUnit, Rank_UnknownSegment) {
	auto table = makeTable(2);
	LabelStore labels(table);
	const UncertaintySelector selector;

	EXPECT_THROW(selector.rank(*table, predictionsWithEntropy({{1, 0.3}, {7, 0.2}}), labels), UnknownSegmentError);
}

TEST(UncertaintyUnit, Rank_FromStoredPredictions) {
	auto table = makeTable(3);
	LabelStore labels(table);

	PropagationResult result{};
	result.classes     = {"forest", "water"};
	result.predictions = predictionsWithEntropy({{1, 0.2}, {2, 0.8}, {3, 0.4}});
	labels.applyPropagationResult(result);
	labels.setManual(2, "forest", "#00ff00");

	const UncertaintySelector selector;
	const auto ranking = selector.rank(labels);
	ASSERT_EQ(ranking.size(), 2u);
	EXPECT_EQ(ranking[0].id, 3);
	EXPECT_DOUBLE_EQ(ranking[0].entropy, 0.4);
	EXPECT_EQ(ranking[1].id, 1);
}

// Twenty unlabelled segments with entropies 0.9, 0.86, ..., 0.14.
TEST(UncertaintyUnit, Select_ThresholdAndTopK) {
	std::vector<RankedSegment> ranking;
	for (int i = 0; i < 20; ++i) {
		ranking.push_back({100 + i, 0.9 - 0.04 * static_cast<double>(i)});
	}

	const std::vector<SegmentId> selected = UncertaintySelector::select(ranking, 0.6, 5);
	ASSERT_EQ(selected.size(), 5u);
	EXPECT_EQ(selected, (std::vector<SegmentId>{100, 101, 102, 103, 104}));

	double previous = 1.0;
	for (const SegmentId id: selected) {
		const double entropy = ranking[static_cast<std::size_t>(id - 100)].entropy;
		EXPECT_GE(entropy, 0.6);
		EXPECT_LE(entropy, previous);
		previous = entropy;
	}
}

TEST(UncertaintyUnit, Select_ThresholdCutsBeforeTopK) {
	std::vector<RankedSegment> ranking;
	for (int i = 0; i < 20; ++i) {
		ranking.push_back({i, 0.9 - 0.04 * static_cast<double>(i)});
	}

	// 0.9 .. 0.62 are >= 0.6: eight segments.
	EXPECT_EQ(UncertaintySelector::select(ranking, 0.6, 50).size(), 8u);
	EXPECT_TRUE(UncertaintySelector::select(ranking, 0.95, 5).empty());
	EXPECT_TRUE(UncertaintySelector::select(ranking, 0.1, 0).empty());
}

TEST(UncertaintyUnit, Select_UnsortedInput) {
	const std::vector<RankedSegment> ranking = {{5, 0.7}, {2, 0.9}, {9, 0.7}, {1, 0.2}};
	EXPECT_EQ(UncertaintySelector::select(ranking, 0.5, 10), (std::vector<SegmentId>{2, 5, 9}));
}

TEST(UncertaintyUnit, Select_ConfiguredDefaults) {
	const UncertaintySelector selector(SelectionConfig{0.5, 2u});
	const std::vector<RankedSegment> ranking = {{1, 0.9}, {2, 0.8}, {3, 0.7}, {4, 0.1}};
	EXPECT_EQ(selector.select(ranking), (std::vector<SegmentId>{1, 2}));
}

} // namespace gtest
} // namespace geolabel::classification::core
