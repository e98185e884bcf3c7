#ifndef __ZONEGEN_ERRORS_H__
#define __ZONEGEN_ERRORS_H__

#include <exception>
#include <string>

#include <magic_enum.hpp>

enum class ZoneGenStage
{
    Fetch,
    Parse,
    Validate,
    Emit
};

// Any ZoneGenException aborts the dataset build.
class ZoneGenException : public std::exception
{
private:
    ZoneGenStage _stage;
    std::string _message;
public:
    ZoneGenException(ZoneGenStage stage, const std::string& message)
        : _stage(stage)
        , _message(std::string(magic_enum::enum_name(stage)) + ": " + message)
    {
    }

    ZoneGenException(ZoneGenStage stage, const std::string& message, const std::exception& cause)
        : ZoneGenException(stage, message + ": " + cause.what())
    {
    }

    ZoneGenStage GetStage() const { return _stage; }

    virtual const char* what() const noexcept override
    {
        return _message.c_str();
    }
};

#endif // __ZONEGEN_ERRORS_H__
