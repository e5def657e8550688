/**
 * @file FleetErrors.hpp
 * @brief Typed error taxonomy surfaced by every registry operation.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace fleetkeeper::domain {

/**
 * @class FleetError
 * @brief Common base so callers can catch any registry failure in one place.
 */
class FleetError : public std::runtime_error {
public:
    explicit FleetError(const std::string& message) : std::runtime_error(message) {}
};

/** @brief Malformed or out-of-range caller input. */
class InvalidInputError : public FleetError {
public:
    explicit InvalidInputError(const std::string& message) : FleetError(message) {}
};

/** @brief The referenced boat id is not in the registry. */
class NotFoundError : public FleetError {
public:
    explicit NotFoundError(const std::string& boatId)
        : FleetError("Boat not found: " + boatId), m_boatId(boatId) {}

    const std::string& boatId() const { return m_boatId; }

private:
    std::string m_boatId;
};

/** @brief A boat with the same id already exists. */
class DuplicateIdError : public FleetError {
public:
    explicit DuplicateIdError(const std::string& boatId)
        : FleetError("Duplicate boat id: " + boatId), m_boatId(boatId) {}

    const std::string& boatId() const { return m_boatId; }

private:
    std::string m_boatId;
};

/**
 * @class PersistenceError
 * @brief I/O failure while saving or loading the fleet document.
 */
class PersistenceError : public FleetError {
public:
    explicit PersistenceError(const std::string& message) : FleetError(message) {}
};

/**
 * @class SchemaError
 * @brief The persisted document is readable but structurally invalid.
 */
class SchemaError : public PersistenceError {
public:
    SchemaError(const std::string& where, const std::string& message)
        : PersistenceError("Schema error at " + (where.empty() ? std::string("/") : where) + ": " + message),
          m_where(where.empty() ? "/" : where) {}

    /** @brief JSON-pointer style location of the offending value (e.g. "/boats/2/id"). */
    const std::string& where() const { return m_where; }

private:
    std::string m_where;
};

} // namespace fleetkeeper::domain
