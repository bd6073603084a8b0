/**
 * @file category.hpp
 * @brief Resolution of category / service selectors into service names.
 */

#ifndef MWD_CATEGORY_HPP_
#define MWD_CATEGORY_HPP_

#include <map>
#include <set>
#include <string>
#include <vector>

namespace mwd {

/**
 * @brief Expand selectors into the set of concrete service names.
 *
 * A selector naming a category is replaced by the category's members, which
 * may themselves be categories. Each category is expanded at most once, so
 * self-referencing or mutually-referencing categories terminate. A selector
 * that is not a category is taken as a service name.
 *
 * @param selectors   Category or service names; nullptr is treated as empty.
 * @param categories  Category name -> member names.
 */
inline std::set<std::string> ExpandCategories(
    const std::vector<std::string>* selectors,
    const std::map<std::string, std::set<std::string>>& categories) {
  std::set<std::string> services;
  if (selectors == nullptr) return services;

  std::vector<std::string> work(selectors->begin(), selectors->end());
  std::set<std::string> expanded;
  while (!work.empty()) {
    std::string name = std::move(work.back());
    work.pop_back();

    auto it = categories.find(name);
    if (it == categories.end()) {
      services.insert(std::move(name));
      continue;
    }
    if (!expanded.insert(name).second) continue;
    for (const auto& member : it->second) work.push_back(member);
  }
  return services;
}

inline std::set<std::string> ExpandCategories(
    const std::vector<std::string>& selectors,
    const std::map<std::string, std::set<std::string>>& categories) {
  return ExpandCategories(&selectors, categories);
}

}  // namespace mwd

#endif  // MWD_CATEGORY_HPP_
