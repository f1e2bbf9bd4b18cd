// SPDX-License-Identifier: Apache-2.0
#include <review/FuzzyProjectIndex.hpp>

#include <algorithm>

namespace clockr::review
{

namespace
{
    auto foldCase(std::string_view text) -> std::string
    {
        auto result = std::string(text);
        std::ranges::transform(result, result.begin(), [](char c) {
            return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
        });
        return result;
    }
} // namespace

FuzzyProjectIndex::FuzzyProjectIndex(std::vector<clockify::Project> projects): _projects(std::move(projects))
{
    _foldedNames.reserve(_projects.size());
    for (auto const& project: _projects)
        _foldedNames.push_back(foldCase(project.name));
}

auto FuzzyProjectIndex::filter(std::string_view query) const -> std::vector<clockify::Project>
{
    auto const needle = foldCase(query);
    auto result = std::vector<clockify::Project> {};
    for (auto i = std::size_t { 0 }; i < _projects.size(); ++i)
    {
        if (_foldedNames[i].find(needle) != std::string::npos)
            result.push_back(_projects[i]);
    }
    return result;
}

auto FuzzyProjectIndex::matches(std::string_view name, std::string_view query) -> bool
{
    return foldCase(name).find(foldCase(query)) != std::string::npos;
}

} // namespace clockr::review
