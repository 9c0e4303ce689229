// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logroll Contributors

#include "logroll/collision_registry.hpp"

#include <algorithm>
#include <mutex>
#include <unordered_map>

namespace logroll {

namespace fs = std::filesystem;

struct CollisionRegistry::Impl {
    mutable std::mutex mutex;
    std::unordered_map<std::string, Owner> files;
    std::unordered_map<std::string, Owner> patterns;

    std::optional<Owner> claim(std::unordered_map<std::string, Owner>& table,
                               std::string key, const Owner& owner) {
        std::lock_guard lock(mutex);
        auto [it, inserted] = table.try_emplace(std::move(key), owner);
        if (inserted || it->second.id == owner.id) {
            return std::nullopt;
        }
        return it->second;
    }

    static void drop(std::unordered_map<std::string, Owner>& table, OwnerId id) {
        std::erase_if(table, [id](const auto& entry) { return entry.second.id == id; });
    }
};

CollisionRegistry::CollisionRegistry() : impl_(std::make_unique<Impl>()) {}

CollisionRegistry::~CollisionRegistry() = default;

std::optional<CollisionRegistry::Owner>
CollisionRegistry::register_file(const fs::path& file, const Owner& owner) {
    return impl_->claim(impl_->files, normalize(file), owner);
}

std::optional<CollisionRegistry::Owner>
CollisionRegistry::register_pattern(std::string_view pattern, const Owner& owner) {
    return impl_->claim(impl_->patterns, normalize(fs::path(pattern)), owner);
}

void CollisionRegistry::release(OwnerId id) {
    std::lock_guard lock(impl_->mutex);
    Impl::drop(impl_->files, id);
    Impl::drop(impl_->patterns, id);
}

std::size_t CollisionRegistry::file_count() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->files.size();
}

std::size_t CollisionRegistry::pattern_count() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->patterns.size();
}

std::string CollisionRegistry::normalize(const fs::path& path) {
    std::error_code ec;
    auto abs = fs::absolute(path, ec);
    if (ec) {
        abs = path;
    }
    return abs.lexically_normal().generic_string();
}

std::string collision_message(std::string_view option, std::string_view value,
                              std::string_view owner) {
    std::string msg;
    msg.reserve(96 + value.size() + owner.size());
    msg.push_back('\'');
    msg.append(option);
    msg.append("' option has the same value \"");
    msg.append(value);
    msg.append("\" as that given for appender [");
    msg.append(owner);
    msg.append("] defined earlier.");
    return msg;
}

} // namespace logroll
