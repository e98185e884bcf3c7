#include <cstdlib>
#include <deque>
#include <fstream>
#include <iostream>
#include <iterator>
#include <system_error>

#include <magic_enum.hpp>

#include <libsystz/Helpers/StringHelpers.h>
#include <libsystz/SystemTz.h>
#include <libsystz/UnixTzResolver.h>

namespace LibSysTz
{
    static constexpr auto unixTzSources = magic_enum::enum_values<UnixTzSource>();

    UnixTzResolver::UnixTzResolver()
        : UnixTzResolver("/", [](const char* name) -> const char* { return getenv(name); })
    {
    }

    UnixTzResolver::UnixTzResolver(const std::filesystem::path& root, const EnvironmentLookup& getEnv)
        : root(root)
        , getEnv(getEnv)
        , debug(SystemTzDebugEnabled(getEnv("SYSTZ_DEBUG")))
    {
    }

    std::filesystem::path UnixTzResolver::Rooted(std::string_view path) const
    {
        std::filesystem::path result(path);
        if (root == "/")
        {
            return result;
        }
        return root / result.relative_path();
    }

    std::optional<std::string> UnixTzResolver::ReadFile(std::string_view path) const
    {
        std::ifstream fin(Rooted(path));
        if (!fin.is_open())
        {
            return std::nullopt;
        }

        std::string content((std::istreambuf_iterator<char>(fin)), std::istreambuf_iterator<char>());
        if (fin.bad())
        {
            return std::nullopt;
        }
        return content;
    }

    std::optional<std::filesystem::path> UnixTzResolver::ResolveRooted(const std::filesystem::path& path) const
    {
        // Same limit as Linux's MAXSYMLINKS.
        static constexpr int maxLinks = 40;

        std::deque<std::filesystem::path> pending(path.begin(), path.end());
        std::filesystem::path resolved("/");
        int links = 0;

        while (!pending.empty())
        {
            std::filesystem::path component = pending.front();
            pending.pop_front();

            if (component.empty() || component == "/" || component == ".")
            {
                continue;
            }
            if (component == "..")
            {
                resolved = resolved.parent_path();
                continue;
            }

            std::filesystem::path next = resolved / component;

            std::error_code ec;
            if (!std::filesystem::is_symlink(Rooted(next.string()), ec))
            {
                resolved = next;
                continue;
            }

            if (++links > maxLinks)
            {
                return std::nullopt;
            }

            std::filesystem::path target = std::filesystem::read_symlink(Rooted(next.string()), ec);
            if (ec)
            {
                return std::nullopt;
            }

            // Absolute targets restart from the resolver's root, not the host's.
            if (target.is_absolute())
            {
                resolved = "/";
            }
            pending.insert(pending.begin(), target.begin(), target.end());
        }

        std::error_code ec;
        if (!std::filesystem::exists(Rooted(resolved.string()), ec))
        {
            return std::nullopt;
        }
        return resolved;
    }

    // References:
    // * https://man7.org/linux/man-pages/man5/localtime.5.html
    // * https://www.man7.org/linux/man-pages/man1/timedatectl.1.html
    std::optional<std::string> UnixTzResolver::ReadLocaltimeLink(std::string_view path) const
    {
        std::error_code ec;
        if (!std::filesystem::is_symlink(Rooted(path), ec))
        {
            return std::nullopt;
        }

        auto target = ResolveRooted(std::filesystem::path(path));
        if (!target.has_value())
        {
            return std::nullopt;
        }

        auto split = Helpers::splitOnce(target->string(), "/zoneinfo/");
        if (!split.has_value())
        {
            return std::nullopt;
        }
        return std::string(split->second);
    }

    std::optional<std::string> UnixTzResolver::ScanConfigFile(std::string_view path,
        std::initializer_list<std::string_view> keys) const
    {
        std::ifstream fin(Rooted(path));
        if (!fin.is_open())
        {
            return std::nullopt;
        }

        std::string line;
        while (std::getline(fin, line))
        {
            std::string key = Helpers::trimStart(line);

            bool matches = false;
            for (const auto& k : keys)
            {
                matches = matches || Helpers::startsWith(key, k);
            }

            if (!matches)
            {
                continue;
            }

            // Only the first matching line counts.
            auto split = Helpers::splitOnce(line, "=");
            if (!split.has_value())
            {
                return std::nullopt;
            }
            return Helpers::unquote(Helpers::trim(split->second));
        }

        return std::nullopt;
    }

    std::optional<std::string> UnixTzResolver::ReadCandidate(UnixTzSource source) const
    {
        switch (source)
        {
            case UnixTzSource::Environment:
            {
                const char* tz = getEnv("TZ");
                if (tz == NULL)
                {
                    return std::nullopt;
                }
                // POSIX allows TZ=":Area/Location".
                std::string value = Helpers::trim(tz);
                if (Helpers::startsWith(value, ":"))
                {
                    value.erase(0, 1);
                }
                return value;
            }
            case UnixTzSource::EtcTimezone:
                return ReadFile("/etc/timezone");
            case UnixTzSource::VarDbZoneinfo:
                return ReadFile("/var/db/zoneinfo");
            case UnixTzSource::EtcLocaltime:
                return ReadLocaltimeLink("/etc/localtime");
            case UnixTzSource::UsrLocalEtcLocaltime:
                return ReadLocaltimeLink("/usr/local/etc/localtime");
            // CentOS and OpenSUSE
            case UnixTzSource::SysconfigClock:
                return ScanConfigFile("/etc/sysconfig/clock", { "ZONE", "TIMEZONE" });
            // Gentoo
            case UnixTzSource::ConfdClock:
                return ScanConfigFile("/etc/conf.d/clock", { "TIMEZONE" });
            case UnixTzSource::DefaultInit:
                return ScanConfigFile("/etc/default/init", { "TZ" });
            case UnixTzSource::UsrLocalDefaultInit:
                return ScanConfigFile("/usr/local/etc/default/init", { "TZ" });
        }

        return std::nullopt;
    }

    std::optional<Tz> UnixTzResolver::Probe(UnixTzSource source) const
    {
        auto candidate = ReadCandidate(source);
        if (!candidate.has_value())
        {
            return std::nullopt;
        }

        auto tz = Tz::TryParseInsensitive(candidate.value());
        if (!tz.has_value() && debug)
        {
            std::cerr << "systz: " << magic_enum::enum_name(source)
                << ": ignoring unknown time zone \"" << Helpers::trim(candidate.value()) << "\"" << std::endl;
        }
        return tz;
    }

    std::optional<std::pair<Tz, UnixTzSource>> UnixTzResolver::ResolveWithSource() const
    {
        for (const auto& source : unixTzSources)
        {
            auto tz = Probe(source);
            if (tz.has_value())
            {
                if (debug)
                {
                    std::cerr << "systz: " << magic_enum::enum_name(source) << ": " << tz.value() << std::endl;
                }
                return std::make_pair(tz.value(), source);
            }
        }

        if (debug)
        {
            std::cerr << "systz: no source under " << root << " yielded a time zone" << std::endl;
        }
        return std::nullopt;
    }

    std::optional<Tz> UnixTzResolver::Resolve() const
    {
        auto result = ResolveWithSource();
        if (!result.has_value())
        {
            return std::nullopt;
        }
        return result->first;
    }
}
