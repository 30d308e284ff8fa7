#pragma once

#include <string>
#include <string_view>
#include <unordered_set>

namespace loft {

/// Owns one copy of every distinct string handed to it.
/// Returned views stay valid for the lifetime of the interner, which lets the
/// arena-allocated AST refer to names and literal text by `string_view`.
class StringInterner {
public:
    /// Intern a string, returning the stable view of the stored copy.
    [[nodiscard]] std::string_view intern(std::string_view str) {
        auto it = strings_.find(str);
        if (it != strings_.end()) {
            return *it;
        }
        auto [inserted, _] = strings_.emplace(str);
        return *inserted;
    }

    [[nodiscard]] size_t size() const { return strings_.size(); }

private:
    // Node-based set: element addresses never move, so views stay valid.
    struct StringHash {
        using is_transparent = void;
        [[nodiscard]] size_t operator()(std::string_view sv) const {
            return std::hash<std::string_view>{}(sv);
        }
    };

    struct StringEqual {
        using is_transparent = void;
        [[nodiscard]] bool operator()(std::string_view a, std::string_view b) const {
            return a == b;
        }
    };

    std::unordered_set<std::string, StringHash, StringEqual> strings_;
};

} // namespace loft
