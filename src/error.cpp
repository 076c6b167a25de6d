#include "error.hpp"

namespace cidgen
{
    std::string_view cid_strerror(cid_error e)
    {
        switch (e)
        {
            case cid_error::none:
                return "No error"sv;
            case cid_error::bad_length:
                return "Connection ID has the wrong length for this generator"sv;
            case cid_error::bad_signature:
                return "Connection ID signature does not match"sv;
        }
        return "Unknown connection ID error"sv;
    }
}  // namespace cidgen
