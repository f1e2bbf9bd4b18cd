// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <clockify/Models.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace clockr::review
{

/// @brief Case-insensitive substring search over the project catalog.
///
/// filter() returns the subsequence of the catalog whose project name
/// contains the query, preserving catalog order. An empty query matches every
/// project. Case folding is ASCII-only.
class FuzzyProjectIndex
{
  public:
    FuzzyProjectIndex() = default;
    explicit FuzzyProjectIndex(std::vector<clockify::Project> projects);

    [[nodiscard]] auto filter(std::string_view query) const -> std::vector<clockify::Project>;

    [[nodiscard]] auto projects() const noexcept -> std::vector<clockify::Project> const& { return _projects; }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return _projects.size(); }

    /// @brief True if @p name contains @p query, ignoring ASCII case.
    [[nodiscard]] static auto matches(std::string_view name, std::string_view query) -> bool;

  private:
    std::vector<clockify::Project> _projects;
    std::vector<std::string> _foldedNames; ///< Lowercased names, parallel to _projects.
};

} // namespace clockr::review
