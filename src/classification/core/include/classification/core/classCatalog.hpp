#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace geolabel::classification::core {

struct ClassEntry {
	std::string name;  //!< Normalised class name.
	std::string color; //!< "#rrggbb".
};

/*! Class name <-> display colour mapping of one project.
 *  A colour is assigned once, on first registration, and never changes afterwards. Re-registering a name returns the stored colour.
 */
class ClassCatalog {
public:
	static constexpr std::string_view UNCLASSIFIED_COLOR = "#ffcc00"; //!< Colour of segments without any label.

	//! Trim surrounding whitespace and lower-case.
	static std::string normalize(std::string_view name);
	//! Deterministic colour for names that are not in the catalog (hash of the name mapped to a hue).
	static std::string fallbackColor(std::string_view name);
	//! Accepts "#rrggbb" in any case.
	static bool isValidColor(std::string_view color);

	/*! Register a class.
	 * \param [in] name           Class name. Normalised before use.
	 * \param [in] requestedColor Colour used if the class is new. Invalid or empty -> fallbackColor(name).
	 * \return     The colour stored for the class.
	 * \throws     InvalidClassError if the normalised name is empty.
	 */
	std::string registerClass(std::string_view name, std::string_view requestedColor);

	//! Remove a class. No-op if absent.
	void remove(std::string_view name);

	//! Stored colour, or fallbackColor() for unknown names. Does not modify the catalog.
	std::string colorOf(std::string_view name) const;

	bool contains(std::string_view name) const;
	std::size_t size() const {
		return m_colors.size();
	}
	bool empty() const {
		return m_colors.empty();
	}
	std::vector<ClassEntry> entries() const; //!< Sorted by name.

private:
	std::map<std::string, std::string, std::less<>> m_colors{};
};

} // namespace geolabel::classification::core
