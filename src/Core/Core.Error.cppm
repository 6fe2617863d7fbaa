module;

#include <cstdint>
#include <expected>
#include <string_view>
#include <utility>

export module Core:Error;

export namespace Core
{
    // -------------------------------------------------------------------------
    // Error Handling Strategy
    // -------------------------------------------------------------------------
    // 1. std::expected<T, E>  - For FALLIBLE operations where failure is expected
    //                          and the caller MUST handle it:
    //                          - File I/O, catalog parsing, config validation
    //                          - Precomputed resource fetches
    //
    // 2. std::optional<T>    - For QUERIES where "not found" is a valid outcome:
    //                          - Resident entry lookup by entity id
    //                          - Memo table lookups
    //
    // 3. Raw pointers (T*)   - ONLY for non-owning observation of existing objects
    //                          where nullptr means "no reference" (pool lookups).
    //
    // 4. Assertions          - For INVARIANTS that should never be violated.
    //
    // Nothing reachable from the per-frame path throws. Failures degrade quality
    // and are reported through logs and statistics.
    // -------------------------------------------------------------------------

    enum class ErrorCode : uint32_t
    {
        Success = 0,

        // Resource errors (100-199)
        OutOfMemory = 100,
        ResourceNotFound = 101,
        ResourceBusy = 102,
        ResourceCorrupted = 103,

        // I/O errors (200-299)
        FileNotFound = 200,
        FileReadError = 201,
        FileWriteError = 202,
        InvalidPath = 203,

        // Validation errors (300-399)
        InvalidArgument = 300,
        InvalidState = 301,
        InvalidFormat = 302,
        OutOfRange = 303,

        // Asset errors (500-599)
        AssetNotLoaded = 500,
        AssetLoadFailed = 501,

        // Generic
        Unknown = 999
    };

    constexpr std::string_view ErrorCodeToString(ErrorCode code)
    {
        switch (code)
        {
            case ErrorCode::Success:           return "Success";
            case ErrorCode::OutOfMemory:       return "OutOfMemory";
            case ErrorCode::ResourceNotFound:  return "ResourceNotFound";
            case ErrorCode::ResourceBusy:      return "ResourceBusy";
            case ErrorCode::ResourceCorrupted: return "ResourceCorrupted";
            case ErrorCode::FileNotFound:      return "FileNotFound";
            case ErrorCode::FileReadError:     return "FileReadError";
            case ErrorCode::FileWriteError:    return "FileWriteError";
            case ErrorCode::InvalidPath:       return "InvalidPath";
            case ErrorCode::InvalidArgument:   return "InvalidArgument";
            case ErrorCode::InvalidState:      return "InvalidState";
            case ErrorCode::InvalidFormat:     return "InvalidFormat";
            case ErrorCode::OutOfRange:        return "OutOfRange";
            case ErrorCode::AssetNotLoaded:    return "AssetNotLoaded";
            case ErrorCode::AssetLoadFailed:   return "AssetLoadFailed";
            default:                           return "Unknown";
        }
    }

    template <typename T>
    using Expected = std::expected<T, ErrorCode>;

    template <typename T>
    constexpr Expected<T> Ok(T&& value)
    {
        return Expected<T>(std::forward<T>(value));
    }

    template <typename T>
    constexpr Expected<T> Err(ErrorCode code)
    {
        return std::unexpected(code);
    }

    // Void success type for operations that don't return a value
    struct Unit {};
    inline constexpr Unit unit{};

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
