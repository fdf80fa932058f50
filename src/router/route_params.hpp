#ifndef BEXT_ROUTER_ROUTE_PARAMS_HPP
#define BEXT_ROUTER_ROUTE_PARAMS_HPP

#include <algorithm>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace Bext {

/*
 * Path parameters captured by a route pattern. Iteration follows the order the
 * keys were first inserted; assigning an existing key replaces its value in place.
 */
class RouteParams {
public:
    using Entry = std::pair<std::string, std::string>;
    using const_iterator = std::vector<Entry>::const_iterator;

    RouteParams() = default;
    RouteParams(std::initializer_list<Entry> entries) {
        for (const auto &entry : entries) {
            set(entry.first, entry.second);
        }
    }

    void set(const std::string &key, std::string value) {
        auto it = std::find_if(entries_.begin(), entries_.end(),
                               [&key](const Entry &e) { return e.first == key; });
        if (it != entries_.end()) {
            it->second = std::move(value);
        } else {
            entries_.emplace_back(key, std::move(value));
        }
    }

    const std::string *find(const std::string &key) const {
        auto it = std::find_if(entries_.begin(), entries_.end(),
                               [&key](const Entry &e) { return e.first == key; });
        return it != entries_.end() ? &it->second : nullptr;
    }

    bool contains(const std::string &key) const { return find(key) != nullptr; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

    std::map<std::string, std::string> toMap() const {
        return std::map<std::string, std::string>(entries_.begin(), entries_.end());
    }

    bool operator==(const RouteParams &other) const { return entries_ == other.entries_; }
    bool operator!=(const RouteParams &other) const { return !(*this == other); }

private:
    std::vector<Entry> entries_;
};

} // namespace Bext

#endif
