#pragma once

#include "classification/core/classCatalog.hpp"
#include "classification/core/featureTable.hpp"

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace geolabel::classification::core {

struct PropagationResult;

//! Where the label shown for a segment comes from.
enum class LabelOrigin { None, Manual, Predicted };

std::string_view toString(LabelOrigin origin);

struct ManualLabel {
	std::string className;   //!< Normalised class name.
	std::string color;       //!< Catalog colour at assignment time.
	std::string analyst{};   //!< Who assigned it. May be empty.
	std::string timestamp{}; //!< ISO-8601 UTC of the (last changing) assignment.
};

struct PredictedLabel {
	std::string className;
	std::map<std::string, double> probabilities{}; //!< Class -> probability. Sums to 1.
	double uncertainty{0.0};                       //!< Normalised entropy of probabilities, [0,1].
};

//! All label state of one segment. The predicted label is kept even while a manual label hides it.
struct LabelRecord {
	std::optional<ManualLabel> manual{};
	std::optional<PredictedLabel> predicted{};
};

//! Export row: a manually labelled segment.
struct LabeledSegment {
	SegmentId id;
	std::string className;
	std::string color;
};

//! ISO-8601 UTC timestamp with second precision ("2026-01-31T12:00:00Z").
std::string utcNow();

/*! Manual and predicted labels over a fixed feature table.
 *  Owns the class catalog of the project: every manual label refers to a registered class.
 */
class LabelStore {
public:
	explicit LabelStore(std::shared_ptr<const FeatureTable> table);

	const FeatureTable& table() const {
		return *m_table;
	}
	const ClassCatalog& catalog() const {
		return m_catalog;
	}
	ClassCatalog& catalog() {
		return m_catalog;
	}

	/*! Manually label a segment. Registers the class if it is new.
	 * \param [in] id        Segment id.
	 * \param [in] className Class name. Normalised.
	 * \param [in] color     Requested colour. Ignored if the class already exists.
	 * \param [in] analyst   Optional analyst name.
	 * \param [in] timestamp Optional timestamp. Empty -> now. Relabelling with the same class keeps the previous timestamp.
	 * \return     Colour stored for the class.
	 * \throws     UnknownSegmentError, InvalidClassError.
	 */
	std::string setManual(SegmentId id, std::string_view className, std::string_view color, std::string_view analyst = {},
	                      std::string_view timestamp = {});

	bool clearManual(SegmentId id); //!< Returns true if a manual label was removed.

	//! Remove a class from the catalog and clear every manual label using it. Predicted labels stay. Returns the number of cleared segments.
	std::size_t removeClass(std::string_view name);

	//! Store predictions of a propagation pass. Manual labels are not touched.
	void applyPropagationResult(const PropagationResult& result);
	void restorePrediction(SegmentId id, PredictedLabel predicted); //!< Used when loading persisted predictions.

	//! Manually labelled segments sorted by id.
	std::vector<LabeledSegment> exportLabeled() const;

	const LabelRecord& record(SegmentId id) const;
	LabelOrigin origin(SegmentId id) const;
	std::optional<std::string> displayLabel(SegmentId id) const; //!< Manual label first, then predicted.
	std::string displayColor(SegmentId id) const;

	std::set<std::string> distinctManualClasses() const;
	std::size_t manualCount() const;
	bool hasPredictions() const;

private:
	std::shared_ptr<const FeatureTable> m_table;
	ClassCatalog m_catalog{};
	std::vector<LabelRecord> m_records{}; //!< Indexed by feature table row.
};

} // namespace geolabel::classification::core
