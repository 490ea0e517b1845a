#include <tempo/outcome.hpp>

namespace tempo
{

    const char* to_string(outcome_kind kind)
    {
        switch (kind)
        {
            case outcome_kind::null:
                return "null";
            case outcome_kind::empty:
                return "empty";
            case outcome_kind::success:
                return "success";
            case outcome_kind::error:
                return "error";
            case outcome_kind::timeout:
                return "timeout";
            case outcome_kind::waiting:
                return "waiting";
        }
        return "unknown";
    }

    const char* to_string(throttle_status status)
    {
        switch (status)
        {
            case throttle_status::accepted:
                return "accepted";
            case throttle_status::throttled:
                return "throttled";
        }
        return "unknown";
    }

} // namespace tempo
