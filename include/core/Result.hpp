#pragma once
/** @file  Result.hpp
 *  @brief Status codes returned across the service boundary instead of exceptions.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace reveille {
  namespace core {

    /**
 * @enum Status
 * @brief Outcome of a boundary operation.
 *
 *  * `NotPersisted`: the change is live in memory but the store write failed.
 */
    enum class Status : std::uint8_t { Ok, NotFound, Conflict, Invalid, NotPersisted };

    inline const char* toString(Status s) {
      switch (s) {
      case Status::Ok:
        return "ok";
      case Status::NotFound:
        return "not found";
      case Status::Conflict:
        return "conflict";
      case Status::Invalid:
        return "invalid";
      case Status::NotPersisted:
        return "not persisted";
      default:
        return "unknown";
      }
    }

    /// True when the operation took effect (possibly without reaching disk).
    inline bool applied(Status s) { return s == Status::Ok || s == Status::NotPersisted; }

    template <typename T> struct Result {
      Status status{ Status::Ok };
      std::optional<T> value;
      std::string detail; ///< human-readable reason for a rejection

      bool ok() const { return value.has_value(); }
      explicit operator bool() const { return ok(); }

      static Result success(T v, bool durable = true) {
        return Result{ durable ? Status::Ok : Status::NotPersisted, std::move(v), {} };
      }
      static Result failure(Status s, std::string why = {}) {
        return Result{ s, std::nullopt, std::move(why) };
      }
    };

  } // namespace core
} // namespace reveille
