#include "core/types.hpp"

#include <atomic>
#include <ctime>

namespace arbor {

static_assert(sizeof(Uuid) == 16, "Uuid should be 16 bytes");
static_assert(std::is_trivially_copyable_v<Timestamp>, "Timestamp should be trivially copyable");

BlockId make_temp_id() {
    // The counter keeps ids unique when two are minted within one millisecond.
    static std::atomic<uint64_t> counter{0};
    return std::string(TEMP_ID_PREFIX) + std::to_string(Timestamp::now().millis()) +
           "-" + std::to_string(++counter);
}

bool is_temp_id(std::string_view id) noexcept {
    return id.substr(0, TEMP_ID_PREFIX.size()) == TEMP_ID_PREFIX;
}

std::string Timestamp::to_iso_string() const {
    auto time_t = Clock::to_time_t(to_time_point());
    std::tm tm{};
    gmtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    auto ms = millis_ % 1000;
    oss << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';
    return oss.str();
}

} // namespace arbor
