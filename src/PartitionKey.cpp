#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <date/date.h>
#include "PartitionKey.hpp"

namespace
{
    date::year_month toYearMonth(PartitionKey const& key)
    {
        return date::year{key.year} / date::month{key.month};
    }

    PartitionKey fromYearMonth(date::year_month const& ym)
    {
        return PartitionKey{static_cast<int>(ym.year()), static_cast<unsigned>(ym.month())};
    }

    int64_t toEpochSeconds(date::year_month const& ym)
    {
        date::sys_days first{ym / 1};
        return std::chrono::duration_cast<std::chrono::seconds>(first.time_since_epoch()).count();
    }
}

PartitionKey PartitionKey::fromTimestamp(int64_t epochSeconds)
{
    date::sys_seconds tp{std::chrono::seconds{epochSeconds}};
    date::year_month_day ymd{date::floor<date::days>(tp)};
    return fromYearMonth(ymd.year() / ymd.month());
}

PartitionKey PartitionKey::parse(std::string const& yearMonth)
{
    std::istringstream in(yearMonth);
    date::year_month ym{};
    in >> date::parse("%Y-%m", ym);

    if (in.fail() || in.peek() != std::char_traits<char>::eof() || !ym.ok())
        throw std::invalid_argument("not a YYYY-MM month: '" + yearMonth + "'");

    return fromYearMonth(ym);
}

int64_t PartitionKey::periodStart() const
{
    return toEpochSeconds(toYearMonth(*this));
}

int64_t PartitionKey::periodEnd() const
{
    return toEpochSeconds(toYearMonth(*this) + date::months{1});
}

PartitionKey PartitionKey::next() const
{
    return fromYearMonth(toYearMonth(*this) + date::months{1});
}

bool PartitionKey::contains(int64_t epochSeconds) const
{
    return epochSeconds >= periodStart() && epochSeconds < periodEnd();
}

std::string PartitionKey::label() const
{
    std::ostringstream ss;
    ss << std::setfill('0') << std::setw(4) << year << '-' << std::setw(2) << month;
    return ss.str();
}

std::filesystem::path PartitionKey::directory(std::filesystem::path const& archiveRoot) const
{
    std::ostringstream yearDir;
    std::ostringstream monthDir;
    yearDir << "year=" << std::setfill('0') << std::setw(4) << year;
    monthDir << "month=" << std::setfill('0') << std::setw(2) << month;
    return archiveRoot / yearDir.str() / monthDir.str();
}
