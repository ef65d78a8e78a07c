/**
 * @file calendar.hpp
 * @brief Calendar arithmetic on YYYY-MM-DD timestamps.
 *
 * Timestamps are strings beginning with an ISO date (YYYY-MM-DD), optionally
 * followed by a time part ("2024-01-05 13:00:00" or "2024-01-05T13:00:00Z").
 * Only the date part takes part in calendar arithmetic. Day counts use the
 * proleptic Gregorian calendar and do not depend on the local time zone.
 */

#ifndef CRYPTOFOLIO_DATA_CALENDAR_HPP
#define CRYPTOFOLIO_DATA_CALENDAR_HPP

#include <string>

namespace cryptofolio
{
    namespace calendar
    {

        /**
         * @struct CivilDate
         * @brief Year / month / day triple.
         */
        struct CivilDate
        {
            int year = 1970;
            int month = 1; ///< 1-12
            int day = 1;   ///< 1-31
        };

        /**
         * @brief Check that a timestamp starts with a well-formed YYYY-MM-DD date.
         */
        bool is_valid_timestamp(const std::string &timestamp);

        /**
         * @brief Parse the date part of a timestamp.
         * @throws std::invalid_argument if the date part is malformed or out of range
         */
        CivilDate parse_date(const std::string &timestamp);

        /**
         * @brief Format a civil date as YYYY-MM-DD.
         */
        std::string format_date(const CivilDate &date);

        /**
         * @brief Days since 1970-01-01 (negative before the epoch).
         */
        long long days_from_civil(const CivilDate &date);

        /**
         * @brief Inverse of days_from_civil.
         */
        CivilDate civil_from_days(long long days);

        /**
         * @brief Days since epoch of the timestamp's date part.
         */
        long long days_since_epoch(const std::string &timestamp);

        /**
         * @brief Day of week, 0 = Monday ... 6 = Sunday.
         */
        int day_of_week(const std::string &timestamp);

        /**
         * @brief Days since epoch of the Monday starting the timestamp's ISO week.
         *
         * Two timestamps share an ISO week exactly when their week starts match.
         */
        long long iso_week_start(const std::string &timestamp);

        /**
         * @brief Month key year * 12 + (month - 1).
         */
        int month_key(const std::string &timestamp);

        /**
         * @brief Add a number of days to a timestamp's date part.
         * @return YYYY-MM-DD string
         */
        std::string add_days(const std::string &timestamp, long long days);

    } // namespace calendar
} // namespace cryptofolio

#endif // CRYPTOFOLIO_DATA_CALENDAR_HPP
