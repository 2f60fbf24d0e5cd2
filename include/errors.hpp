#ifndef ERRORS_H
#define ERRORS_H

#include <stdexcept>
#include <string>

/**
 * @class ConfigError
 * @brief Raised when a system config, appliance catalog or profile is invalid.
 *
 * Always thrown before the first simulation step runs.
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @class InsufficientDataError
 * @brief Raised when day-ahead matching receives less than one day of records.
 */
class InsufficientDataError : public std::runtime_error {
public:
    InsufficientDataError(std::size_t available, std::size_t required);

    std::size_t available() const { return available_records; }
    std::size_t required() const { return required_records; }

private:
    std::size_t available_records;
    std::size_t required_records;
};

#endif // ERRORS_H
