/// @file module.cpp
/// @brief CapabilityTable implementation.

#include "intg/loader/module.hpp"

namespace intg::loader {

const CapabilityFn* CapabilityTable::Find(std::string_view name) const {
    auto it = entries_.find(name);
    return it == entries_.end() ? nullptr : &it->second;
}

std::vector<std::string> CapabilityTable::Names() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& [name, fn] : entries_) {
        out.push_back(name);
    }
    return out;
}

}  // namespace intg::loader
