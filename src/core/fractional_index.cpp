#include "core/fractional_index.hpp"

#include <algorithm>
#include <stdexcept>

namespace arbor {

static_assert(FractionalIndex::BASE == 62, "Base should be 62");
static_assert(static_cast<int>(FractionalIndex::DIGITS.size()) == FractionalIndex::BASE);

namespace {

constexpr char ZERO_DIGIT = FractionalIndex::DIGITS.front();

int digit_value(char c) {
    auto pos = FractionalIndex::DIGITS.find(c);
    if (pos == std::string_view::npos) {
        throw std::invalid_argument(std::string("FractionalIndex: invalid digit '") + c + "'");
    }
    return static_cast<int>(pos);
}

// Requires lower < upper. An empty upper stands for 1.0, an empty lower for 0.
std::string midpoint(std::string_view lower, std::string_view upper) {
    if (!upper.empty()) {
        // Shared prefix, reading missing lower digits as zero.
        size_t n = 0;
        while (n < upper.size() &&
               (n < lower.size() ? lower[n] : ZERO_DIGIT) == upper[n]) {
            ++n;
        }
        if (n > 0) {
            return std::string(upper.substr(0, n)) +
                   midpoint(lower.substr(std::min(n, lower.size())), upper.substr(n));
        }
    }

    const int lo = lower.empty() ? 0 : digit_value(lower.front());
    const int hi = upper.empty() ? FractionalIndex::BASE : digit_value(upper.front());

    if (hi - lo > 1) {
        return std::string(1, FractionalIndex::DIGITS[static_cast<size_t>((lo + hi) / 2)]);
    }

    // Adjacent leading digits.
    if (upper.size() > 1) {
        return std::string(upper.substr(0, 1));
    }
    return std::string(1, FractionalIndex::DIGITS[static_cast<size_t>(lo)]) +
           midpoint(lower.empty() ? std::string_view{} : lower.substr(1), std::string_view{});
}

} // namespace

FractionalIndex::FractionalIndex(std::string value) : value_(std::move(value)) {
    for (char c : value_) {
        digit_value(c);
    }
    if (!value_.empty() && value_.back() == ZERO_DIGIT) {
        throw std::invalid_argument("FractionalIndex: key must not end in the zero digit");
    }
}

FractionalIndex FractionalIndex::first() {
    return between(FractionalIndex{}, FractionalIndex{});
}

FractionalIndex FractionalIndex::between(const FractionalIndex& lower,
                                         const FractionalIndex& upper) {
    if (!lower.is_empty() && !upper.is_empty() && !(lower < upper)) {
        throw std::invalid_argument("FractionalIndex::between: lower must sort before upper (" +
                                    lower.value_ + " >= " + upper.value_ + ")");
    }
    FractionalIndex out;
    out.value_ = midpoint(lower.value_, upper.value_);
    return out;
}

} // namespace arbor
