/**
 * @file calendar.cpp
 * @brief Implementation of calendar helpers
 */

#include "data/calendar.hpp"

#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace cryptofolio
{
    namespace calendar
    {

        namespace
        {
            bool is_leap_year(int year)
            {
                return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
            }

            int days_in_month(int year, int month)
            {
                static const int DAYS[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
                if (month == 2 && is_leap_year(year))
                {
                    return 29;
                }
                return DAYS[month - 1];
            }

            // Floor division for negative day counts
            long long floor_div(long long a, long long b)
            {
                long long q = a / b;
                if ((a % b != 0) && ((a < 0) != (b < 0)))
                {
                    --q;
                }
                return q;
            }
        } // anonymous namespace

        bool is_valid_timestamp(const std::string &timestamp)
        {
            if (timestamp.size() < 10)
                return false;
            if (timestamp[4] != '-' || timestamp[7] != '-')
                return false;

            for (size_t i = 0; i < 10; ++i)
            {
                if (i == 4 || i == 7)
                    continue;
                if (!std::isdigit(static_cast<unsigned char>(timestamp[i])))
                    return false;
            }

            // Anything after the date must be a time separator
            if (timestamp.size() > 10 && timestamp[10] != ' ' && timestamp[10] != 'T')
                return false;

            int month = std::stoi(timestamp.substr(5, 2));
            int day = std::stoi(timestamp.substr(8, 2));
            if (month < 1 || month > 12)
                return false;
            int year = std::stoi(timestamp.substr(0, 4));
            return day >= 1 && day <= days_in_month(year, month);
        }

        CivilDate parse_date(const std::string &timestamp)
        {
            if (!is_valid_timestamp(timestamp))
            {
                throw std::invalid_argument("Invalid timestamp (expected YYYY-MM-DD): '" + timestamp + "'");
            }

            CivilDate date;
            date.year = std::stoi(timestamp.substr(0, 4));
            date.month = std::stoi(timestamp.substr(5, 2));
            date.day = std::stoi(timestamp.substr(8, 2));
            return date;
        }

        std::string format_date(const CivilDate &date)
        {
            char buffer[16];
            std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", date.year, date.month, date.day);
            return std::string(buffer);
        }

        long long days_from_civil(const CivilDate &date)
        {
            // Shift the year so that it starts in March; Feb 29 becomes the last day
            long long y = date.year - (date.month <= 2 ? 1 : 0);
            long long era = floor_div(y, 400);
            long long yoe = y - era * 400;
            long long mp = (date.month + 9) % 12;
            long long doy = (153 * mp + 2) / 5 + date.day - 1;
            long long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
            return era * 146097 + doe - 719468;
        }

        CivilDate civil_from_days(long long days)
        {
            days += 719468;
            long long era = floor_div(days, 146097);
            long long doe = days - era * 146097;
            long long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
            long long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
            long long mp = (5 * doy + 2) / 153;

            CivilDate date;
            date.day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
            date.month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
            date.year = static_cast<int>(yoe + era * 400 + (date.month <= 2 ? 1 : 0));
            return date;
        }

        long long days_since_epoch(const std::string &timestamp)
        {
            return days_from_civil(parse_date(timestamp));
        }

        int day_of_week(const std::string &timestamp)
        {
            // 1970-01-01 was a Thursday (index 3 with Monday = 0)
            long long days = days_since_epoch(timestamp);
            long long dow = (days + 3) % 7;
            if (dow < 0)
            {
                dow += 7;
            }
            return static_cast<int>(dow);
        }

        long long iso_week_start(const std::string &timestamp)
        {
            return days_since_epoch(timestamp) - day_of_week(timestamp);
        }

        int month_key(const std::string &timestamp)
        {
            CivilDate date = parse_date(timestamp);
            return date.year * 12 + (date.month - 1);
        }

        std::string add_days(const std::string &timestamp, long long days)
        {
            return format_date(civil_from_days(days_since_epoch(timestamp) + days));
        }

    } // namespace calendar
} // namespace cryptofolio
