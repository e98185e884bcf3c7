#ifndef __LIBSYSTZ_UNIXTZRESOLVER_H__
#define __LIBSYSTZ_UNIXTZRESOLVER_H__

#include <filesystem>
#include <functional>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "Tz.h"

namespace LibSysTz
{
    // Probed in declaration order.
    enum class UnixTzSource
    {
        Environment,
        EtcTimezone,
        VarDbZoneinfo,
        EtcLocaltime,
        UsrLocalEtcLocaltime,
        SysconfigClock,
        ConfdClock,
        DefaultInit,
        UsrLocalDefaultInit
    };

    /// <summary>
    /// <para>Finds the system time zone on unix-like systems by walking the places where the various
    /// distributions record it.  The first candidate that names a known IANA zone wins; sources that are
    /// missing or hold garbage are skipped.</para>
    /// <para>The resolver can be rooted somewhere other than <c>/</c> and given its own environment lookup,
    /// which is how it is tested.  Symbolic links are followed inside that root, including absolute ones.</para>
    /// </summary>
    class UnixTzResolver
    {
    public:
        using EnvironmentLookup = std::function<const char*(const char*)>;

    private:
        const std::filesystem::path root;
        const EnvironmentLookup getEnv;
        const bool debug;

        std::filesystem::path Rooted(std::string_view path) const;

        std::optional<std::string> ReadFile(std::string_view path) const;
        // Follows every symlink of |path|, each one inside root. Returns the
        // resolved path relative to root, or nothing if it does not exist.
        std::optional<std::filesystem::path> ResolveRooted(const std::filesystem::path& path) const;
        std::optional<std::string> ReadLocaltimeLink(std::string_view path) const;
        std::optional<std::string> ScanConfigFile(std::string_view path,
            std::initializer_list<std::string_view> keys) const;

    public:
        UnixTzResolver();
        UnixTzResolver(const std::filesystem::path& root, const EnvironmentLookup& getEnv);

        // The raw, unvalidated candidate a source holds, if any.
        std::optional<std::string> ReadCandidate(UnixTzSource source) const;

        std::optional<Tz> Probe(UnixTzSource source) const;

        std::optional<std::pair<Tz, UnixTzSource>> ResolveWithSource() const;

        std::optional<Tz> Resolve() const;

        const std::filesystem::path& GetRoot() const
        {
            return root;
        }
    };
}

#endif // __LIBSYSTZ_UNIXTZRESOLVER_H__
