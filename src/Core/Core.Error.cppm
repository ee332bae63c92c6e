module;

#include <cstdint>
#include <string_view>
#include <expected>
#include <utility>

export module Core:Error;

export namespace Core
{
    // -------------------------------------------------------------------------
    // Error Handling Strategy
    // -------------------------------------------------------------------------
    // 1. std::expected<T, E>  - For FALLIBLE operations where failure is expected
    //                          and the caller MUST handle it. Use when:
    //                          - Editing a definition that does not allow it
    //                          - Ordering a graph that turned out to be cyclic
    //
    // 2. std::optional<T>    - For QUERIES where "not found" is a valid outcome,
    //                          not an error. Use when:
    //                          - Geometric intersection that might not hit
    //                          - Tile lookups outside the grid
    //
    // 3. Raw pointers (T*)   - ONLY for non-owning observation of existing objects
    //                          where nullptr means "no reference". Use when:
    //                          - Accessing components that may not be attached
    //
    // 4. Assertions          - For INVARIANTS that should never be violated.
    //                          If violated, indicates a bug, not a runtime error.
    //
    // Degenerate constructions (parallel lines, disjoint circles) are neither:
    // they tag the entity Invalid and the frame continues.
    // -------------------------------------------------------------------------

    enum class ErrorCode : uint32_t
    {
        Success = 0,

        // Resource errors (100-199)
        ResourceNotFound = 101,

        // Validation errors (300-399)
        InvalidArgument = 300,
        InvalidState = 301,
        OutOfRange = 303,
        TypeMismatch = 304,

        // Generic
        Unknown = 999
    };

    // Convert error code to string for logging
    constexpr std::string_view ErrorCodeToString(ErrorCode code)
    {
        switch (code)
        {
            case ErrorCode::Success:          return "Success";
            case ErrorCode::ResourceNotFound: return "ResourceNotFound";
            case ErrorCode::InvalidArgument:  return "InvalidArgument";
            case ErrorCode::InvalidState:     return "InvalidState";
            case ErrorCode::OutOfRange:       return "OutOfRange";
            case ErrorCode::TypeMismatch:     return "TypeMismatch";
            default:                          return "Unknown";
        }
    }

    // Type alias for common expected patterns
    template<typename T>
    using Expected = std::expected<T, ErrorCode>;

    // Helper to create success result
    template<typename T>
    constexpr Expected<T> Ok(T&& value)
    {
        return Expected<T>(std::forward<T>(value));
    }

    // Helper to create error result
    template<typename T>
    constexpr Expected<T> Err(ErrorCode code)
    {
        return std::unexpected(code);
    }

    // Void success type for operations that don't return a value
    struct Unit {};
    constexpr Unit unit{};

    using Result = Expected<Unit>;

    constexpr Result Ok()
    {
        return Result(unit);
    }

    constexpr Result Err(ErrorCode code)
    {
        return std::unexpected(code);
    }
}
