#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace maybe_utf8 {

// Text that is either borrowed from existing storage or owned.
//
// Returned by map_as_cow / as_cow_lossy so the common "already text" case
// costs no copy. A borrowed CowText must not outlive the buffer it views.
class CowText {
public:
    CowText() noexcept : value_(std::string_view{}) {}
    CowText(std::string_view borrowed) noexcept : value_(borrowed) {}
    CowText(const char* borrowed) noexcept : value_(std::string_view(borrowed)) {}
    CowText(std::string owned) noexcept : value_(std::move(owned)) {}

    [[nodiscard]] bool is_borrowed() const noexcept {
        return std::holds_alternative<std::string_view>(value_);
    }

    [[nodiscard]] bool is_owned() const noexcept { return !is_borrowed(); }

    [[nodiscard]] std::string_view view() const noexcept {
        if (const auto* sv = std::get_if<std::string_view>(&value_)) {
            return *sv;
        }
        return std::get<std::string>(value_);
    }

    [[nodiscard]] std::size_t size() const noexcept { return view().size(); }
    [[nodiscard]] bool empty() const noexcept { return view().empty(); }

    // Take ownership of the text, copying only if it was borrowed.
    std::string into_owned() && {
        if (auto* s = std::get_if<std::string>(&value_)) {
            return std::move(*s);
        }
        return std::string(std::get<std::string_view>(value_));
    }

    friend bool operator==(const CowText& a, const CowText& b) noexcept {
        return a.view() == b.view();
    }

private:
    std::variant<std::string_view, std::string> value_;
};

} // namespace maybe_utf8
