#include "classification/core/errors.hpp"
#include "classification/session.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace geolabel::classification {
namespace gtest {

using core::PropagationMethod;

static std::shared_ptr<const core::FeatureTable> twoClusters() {
	std::vector<core::SegmentRow> rows;
	for (int i = 0; i < 5; ++i) {
		const double d = 0.01 * static_cast<double>(i);
		rows.push_back({1 + i, "water-" + std::to_string(i), {0.10 + d, 0.20 - d, 0.90}});
	}
	for (int i = 0; i < 5; ++i) {
		const double d = 0.01 * static_cast<double>(i);
		rows.push_back({6 + i, "forest-" + std::to_string(i), {0.80 + d, 0.70, 0.20 + d}});
	}
	return std::make_shared<const core::FeatureTable>(std::vector<std::string>{"b4", "b8", "ndwi"}, std::move(rows));
}

//! Neighbourhoods stay inside a cluster.
static core::EngineConfig tightGraph() {
	core::EngineConfig config{};
	config.propagation.graph.neighbors = 3;
	return config;
}

static const std::vector<ManualLabelRequest> WATER_FOREST = {{1, "water", "#0000ff"}, {6, "forest", "#00ff00"}};

//! Holds the first propagation inside onPropagationStarted until released.
struct StartGate {
	std::promise<void> entered;
	std::promise<void> release;
	std::shared_future<void> released{release.get_future().share()};
	std::atomic<int> calls{0};

	ClassificationSession::Callbacks callbacks() {
		return {[this](PropagationMethod) {
			        if (calls.fetch_add(1) == 0) {
				        entered.set_value();
				        released.wait();
			        }
		        },
		        nullptr};
	}
};

TEST(SessionUnit, StateMachine) {
	ClassificationSession session(twoClusters(), tightGraph());
	EXPECT_EQ(session.state(), SessionState::Fresh);

	session.applyManualLabels({{1, "water", "#0000ff"}});
	EXPECT_EQ(session.state(), SessionState::PartiallyLabeled);

	session.applyManualLabels({{6, "forest", "#00ff00"}});
	EXPECT_EQ(session.state(), SessionState::Ready);

	const PropagationRecord record = session.runPropagation(PropagationMethod::GraphClamped);
	EXPECT_EQ(session.state(), SessionState::Propagated);
	EXPECT_EQ(record.method, "graph-clamped");
	EXPECT_EQ(record.labeledCount, 2u);
	EXPECT_EQ(record.segmentCount, 10u);
	EXPECT_EQ(record.classes, (std::vector<std::string>{"forest", "water"}));
	EXPECT_FALSE(record.timestamp.empty());
	EXPECT_EQ(session.history().size(), 1u);

	session.correctLabel(3, "water");
	EXPECT_EQ(session.state(), SessionState::Ready);
	EXPECT_THROW(session.correctLabel(4, "water"), core::InvalidTransitionError);

	session.runPropagation(PropagationMethod::GraphSoft);
	EXPECT_EQ(session.state(), SessionState::Propagated);
	EXPECT_EQ(session.history().size(), 2u);
	EXPECT_EQ(session.history().back().method, "graph-soft");
}

TEST(SessionUnit, Propagate_NeedsTwoClasses) {
	ClassificationSession session(twoClusters(), tightGraph());
	EXPECT_THROW(session.runPropagation(PropagationMethod::GraphClamped), core::InsufficientLabelsError);

	session.applyManualLabels({{1, "water", "#0000ff"}, {2, "water", "#0000ff"}});
	EXPECT_THROW(session.runPropagationAsync(PropagationMethod::SelfTraining), core::InsufficientLabelsError);
	EXPECT_EQ(session.state(), SessionState::PartiallyLabeled);
	EXPECT_TRUE(session.history().empty());
	EXPECT_FALSE(session.isPropagating());
}

TEST(SessionUnit, CorrectLabel_OnlyAfterPropagation) {
	ClassificationSession session(twoClusters(), tightGraph());
	EXPECT_THROW(session.correctLabel(1, "water"), core::InvalidTransitionError);

	session.applyManualLabels(WATER_FOREST);
	EXPECT_THROW(session.correctLabel(1, "water"), core::InvalidTransitionError);
}

TEST(SessionUnit, ApplyManualLabels_BatchValidated) {
	ClassificationSession session(twoClusters(), tightGraph());
	EXPECT_THROW(session.applyManualLabels({{1, "water", "#0000ff"}, {99, "forest", "#00ff00"}}), core::UnknownSegmentError);
	EXPECT_THROW(session.applyManualLabels({{1, "water", "#0000ff"}, {2, " ", ""}}), core::InvalidClassError);

	EXPECT_EQ(session.state(), SessionState::Fresh);
	EXPECT_TRUE(session.labeled().empty());
	EXPECT_TRUE(session.catalog().empty());
}

TEST(SessionUnit, Segments_DisplayView) {
	ClassificationSession session(twoClusters(), tightGraph());
	session.applyManualLabels(WATER_FOREST);
	session.runPropagation(PropagationMethod::GraphClamped);
	session.correctLabel(7, "water", "", "ana");

	const SegmentView corrected = session.segment(7);
	EXPECT_EQ(corrected.geometry, "forest-1");
	EXPECT_EQ(corrected.origin, core::LabelOrigin::Manual);
	EXPECT_EQ(corrected.displayLabel.value_or(""), "water");
	EXPECT_EQ(corrected.predictedLabel.value_or(""), "forest");
	EXPECT_EQ(corrected.color, "#0000ff");
	ASSERT_TRUE(corrected.uncertainty.has_value());

	const SegmentView predicted = session.segment(9);
	EXPECT_EQ(predicted.origin, core::LabelOrigin::Predicted);
	EXPECT_EQ(predicted.displayLabel.value_or(""), "forest");
	EXPECT_EQ(predicted.color, "#00ff00");
	EXPECT_FALSE(predicted.manualLabel.has_value());
	EXPECT_NEAR(predicted.probabilities.at("forest") + predicted.probabilities.at("water"), 1.0, 1e-9);

	EXPECT_EQ(session.segments().size(), 10u);
	EXPECT_THROW(session.segment(42), core::UnknownSegmentError);
}

TEST(SessionUnit, Unlabelled_BeforePropagation) {
	ClassificationSession session(twoClusters(), tightGraph());
	const SegmentView view = session.segment(2);
	EXPECT_EQ(view.origin, core::LabelOrigin::None);
	EXPECT_FALSE(view.displayLabel.has_value());
	EXPECT_FALSE(view.uncertainty.has_value());
	EXPECT_EQ(view.color, std::string(core::ClassCatalog::UNCLASSIFIED_COLOR));
}

// Deleting a class clears its manual labels but keeps the predictions of the previous run.
TEST(SessionUnit, RemoveClass_KeepsPredictions) {
	ClassificationSession session(twoClusters(), tightGraph());
	session.applyManualLabels({{1, "water", "#0000ff"}, {6, "forest", "#00ff00"}, {7, "forest", "#00ff00"}});
	session.runPropagation(PropagationMethod::GraphClamped);

	EXPECT_EQ(session.removeClass("FOREST"), 2u);
	EXPECT_EQ(session.state(), SessionState::PartiallyLabeled);
	EXPECT_EQ(session.catalog().size(), 1u);

	const SegmentView view = session.segment(6);
	EXPECT_FALSE(view.manualLabel.has_value());
	EXPECT_EQ(view.predictedLabel.value_or(""), "forest");
	EXPECT_EQ(view.origin, core::LabelOrigin::Predicted);

	EXPECT_EQ(session.removeClass("forest"), 0u);
}

TEST(SessionUnit, ClearManualLabel) {
	ClassificationSession session(twoClusters(), tightGraph());
	session.applyManualLabels(WATER_FOREST);

	EXPECT_TRUE(session.clearManualLabel(6));
	EXPECT_FALSE(session.clearManualLabel(6));
	EXPECT_EQ(session.state(), SessionState::PartiallyLabeled);
	EXPECT_THROW(session.clearManualLabel(42), core::UnknownSegmentError);
}

TEST(SessionUnit, Review_ExcludesManualLabels) {
	ClassificationSession session(twoClusters(), tightGraph());
	session.applyManualLabels(WATER_FOREST);
	session.runPropagation(PropagationMethod::GraphClamped);

	const auto ranking = session.ranking();
	EXPECT_EQ(ranking.size(), 8u);
	for (const core::RankedSegment& r: ranking) {
		EXPECT_NE(r.id, 1);
		EXPECT_NE(r.id, 6);
	}

	const auto selected = session.selectForReview(0.0, 3);
	ASSERT_EQ(selected.size(), 3u);
	EXPECT_EQ(selected[0], ranking[0].id);
	EXPECT_TRUE(session.selectForReview(1.01, 10).empty());
}

// Edits submitted while a propagation runs are applied once it completes. The running job sees the old labels.
TEST(SessionUnit, EditsQueuedDuringPropagation) {
	ClassificationSession session(twoClusters(), tightGraph());
	session.applyManualLabels(WATER_FOREST);

	StartGate gate;
	session.connect(gate.callbacks());

	std::future<PropagationRecord> running = session.runPropagationAsync(PropagationMethod::GraphClamped);
	gate.entered.get_future().wait();
	EXPECT_TRUE(session.isPropagating());

	session.applyManualLabels({{2, "water", "#0000ff"}});
	EXPECT_FALSE(session.clearManualLabel(1));
	EXPECT_EQ(session.labeled().size(), 2u); // Queued, not applied yet.
	EXPECT_EQ(session.segments().size(), 10u);

	gate.release.set_value();
	const PropagationRecord record = running.get();
	EXPECT_EQ(record.labeledCount, 2u);

	const std::vector<core::LabeledSegment> labeled = session.labeled();
	ASSERT_EQ(labeled.size(), 2u);
	EXPECT_EQ(labeled[0].id, 2);
	EXPECT_EQ(labeled[1].id, 6);
	EXPECT_EQ(session.state(), SessionState::Ready);
	EXPECT_FALSE(session.isPropagating());

	// The next run trains on the edited labels.
	EXPECT_EQ(session.runPropagation(PropagationMethod::GraphClamped).labeledCount, 2u);
	EXPECT_EQ(session.segment(1).origin, core::LabelOrigin::Predicted);
}

// Last request wins: the running job is cancelled, a queued job is superseded immediately.
TEST(SessionUnit, NewerRequestSupersedes) {
	ClassificationSession session(twoClusters(), tightGraph());
	session.applyManualLabels(WATER_FOREST);

	StartGate gate;
	session.connect(gate.callbacks());

	std::future<PropagationRecord> first = session.runPropagationAsync(PropagationMethod::GraphClamped);
	gate.entered.get_future().wait();

	std::future<PropagationRecord> second = session.runPropagationAsync(PropagationMethod::GraphSoft);
	std::future<PropagationRecord> third  = session.runPropagationAsync(PropagationMethod::SelfTraining);

	ASSERT_EQ(second.wait_for(std::chrono::seconds(0)), std::future_status::ready);
	EXPECT_THROW(second.get(), core::PropagationCancelledError);

	gate.release.set_value();
	EXPECT_THROW(first.get(), core::PropagationCancelledError);

	const PropagationRecord record = third.get();
	EXPECT_EQ(record.method, "self-training");

	const std::vector<PropagationRecord> history = session.history();
	ASSERT_EQ(history.size(), 1u);
	EXPECT_EQ(history.front().method, "self-training");
	EXPECT_EQ(session.state(), SessionState::Propagated);
}

TEST(SessionUnit, Callbacks_FinishedReportsRecord) {
	ClassificationSession session(twoClusters(), tightGraph());
	session.applyManualLabels(WATER_FOREST);

	std::promise<PropagationRecord> finished;
	session.connect({nullptr, [&finished](const PropagationRecord& r) { finished.set_value(r); }});

	session.runPropagation(PropagationMethod::GraphClamped);
	const PropagationRecord record = finished.get_future().get();
	EXPECT_EQ(record.method, "graph-clamped");
	EXPECT_DOUBLE_EQ(record.trainingConsistency, 1.0);

	session.disconnect();
	EXPECT_NO_THROW(session.runPropagation(PropagationMethod::GraphClamped));
}

TEST(SessionUnit, LastTrace) {
	ClassificationSession session(twoClusters(), tightGraph());
	EXPECT_TRUE(session.lastTrace().empty());

	session.applyManualLabels(WATER_FOREST);
	session.runPropagation(PropagationMethod::GraphClamped);
	EXPECT_EQ(session.lastTrace().size(), 4u);
}

TEST(SessionUnit, SnapshotRestore) {
	auto table = twoClusters();
	ProjectSnapshot snapshot;
	{
		ClassificationSession session(table, tightGraph());
		session.applyManualLabels({{1, "water", "#0000ff", "ana"}, {6, "forest", "#00ff00"}});
		session.runPropagation(PropagationMethod::GraphClamped);
		snapshot = session.snapshot();
	}

	ASSERT_EQ(snapshot.samples.size(), 2u);
	EXPECT_EQ(snapshot.samples[0].analyst, "ana");
	EXPECT_EQ(snapshot.predictions.classes, (std::vector<std::string>{"forest", "water"}));
	EXPECT_EQ(snapshot.predictions.segments.size(), 10u);
	EXPECT_EQ(snapshot.predictions.method, "graph-clamped");

	ClassificationSession restored(table, tightGraph());
	restored.restore(snapshot);
	EXPECT_EQ(restored.state(), SessionState::Propagated);
	EXPECT_EQ(restored.history().size(), 1u);
	EXPECT_EQ(restored.segment(1).origin, core::LabelOrigin::Manual);
	EXPECT_EQ(restored.segment(3).predictedLabel.value_or(""), "water");
	EXPECT_EQ(restored.segment(8).color, "#00ff00");
	EXPECT_EQ(restored.labeled().size(), 2u);
}

// Predictions computed from other manual labels than the restored ones are out of date.
TEST(SessionUnit, Restore_StalePredictions) {
	auto table = twoClusters();
	ProjectSnapshot snapshot;
	{
		ClassificationSession session(table, tightGraph());
		session.applyManualLabels(WATER_FOREST);
		session.runPropagation(PropagationMethod::GraphClamped);
		snapshot = session.snapshot();
	}
	ASSERT_EQ(snapshot.predictions.trainedOn.size(), 2u);

	snapshot.samples.push_back({2, "water", "#0000ff"});
	ClassificationSession restored(table, tightGraph());
	restored.restore(snapshot);
	EXPECT_EQ(restored.state(), SessionState::Ready);
	EXPECT_EQ(restored.segment(4).predictedLabel.value_or(""), "water");
	EXPECT_THROW(restored.correctLabel(4, "forest"), core::InvalidTransitionError);

	// Predictions without a recorded training set are never taken as current.
	snapshot.samples.pop_back();
	snapshot.predictions.trainedOn.clear();
	restored.restore(snapshot);
	EXPECT_EQ(restored.state(), SessionState::Ready);
}

TEST(SessionUnit, AnalystUpdate_KeepsPropagated) {
	ClassificationSession session(twoClusters(), tightGraph());
	session.applyManualLabels(WATER_FOREST);
	session.runPropagation(PropagationMethod::GraphClamped);

	session.applyManualLabels({{1, "Water", "", "bo"}});
	EXPECT_EQ(session.state(), SessionState::Propagated);
	EXPECT_EQ(session.snapshot().samples[0].analyst, "bo");

	session.applyManualLabels({{1, "forest", "", "bo"}});
	EXPECT_EQ(session.state(), SessionState::Ready);
}

// A throwing start callback fails the job instead of the worker thread. The session stays usable.
TEST(SessionUnit, Callbacks_StartedThrows) {
	ClassificationSession session(twoClusters(), tightGraph());
	session.applyManualLabels(WATER_FOREST);

	session.connect({[](PropagationMethod) { throw std::logic_error("observer broke"); }, nullptr});
	EXPECT_THROW(session.runPropagation(PropagationMethod::GraphClamped), core::InternalError);
	EXPECT_FALSE(session.isPropagating());
	EXPECT_EQ(session.state(), SessionState::Ready);

	session.disconnect();
	EXPECT_EQ(session.runPropagation(PropagationMethod::GraphClamped).method, "graph-clamped");
}

TEST(SessionUnit, Restore_SkipsUnknownSegments) {
	ProjectSnapshot snapshot;
	snapshot.catalog = {{"water", "#0000ff"}};
	snapshot.samples = {{1, "water", "#0000ff"}, {77, "water", "#0000ff"}};

	ClassificationSession session(twoClusters(), tightGraph());
	session.restore(snapshot);
	EXPECT_EQ(session.labeled().size(), 1u);
	EXPECT_EQ(session.state(), SessionState::PartiallyLabeled);
}

} // namespace gtest
} // namespace geolabel::classification
