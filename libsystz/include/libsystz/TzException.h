#ifndef __LIBSYSTZ_TZEXCEPTION_H__
#define __LIBSYSTZ_TZEXCEPTION_H__

#include <exception>
#include <string>

namespace LibSysTz
{
    /// <summary>
    /// <para>Raised when a name is not a known IANA time zone, or when the time zone database itself cannot be
    /// read.</para>
    /// <para><c>SystemTz()</c> never lets it escape; it only reaches callers of <c>Tz::Parse</c> and
    /// <c>WindowsTz</c>.</para>
    /// </summary>
    class TzException : public std::exception
    {
    private:
        std::string message;
    public:
        TzException(const std::string& message)
            : message(message)
        {
        }

        TzException(const std::string& message, const std::exception& cause)
            : message(message + ": " + cause.what())
        {
        }

        virtual const char* what() const noexcept override
        {
            return message.c_str();
        }
    };

    /// <summary>
    /// Thrown when an IANA identifier has no counterpart in the bundled CLDR <c>windowsZones</c> table.
    /// </summary>
    class UnknownTimezoneException : public TzException
    {
    public:
        UnknownTimezoneException(const std::string& name)
            : TzException("Unknown timezone: " + name)
        {
        }
    };
}

#endif // __LIBSYSTZ_TZEXCEPTION_H__
