#include <tempo/error.hpp>

#include <boost/system/system_error.hpp>

namespace tempo
{

    std::string describe(std::exception_ptr error)
    {
        if (!error)
        {
            return "no error";
        }

        try
        {
            std::rethrow_exception(error);
        }
        catch (const boost::system::system_error& e)
        {
            return "system error [" + std::to_string(e.code().value()) + "]: " + e.what();
        }
        catch (const std::exception& e)
        {
            return e.what();
        }
        catch (...)
        {
            return "unknown error";
        }
    }

} // namespace tempo
