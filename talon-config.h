/*
 * Daemon configuration parsed from a json file
 */

#ifndef __TALON_CONFIG_H__
#define __TALON_CONFIG_H__

#include "talon-layout.h"

#include <nlohmann/json_fwd.hpp>

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace talon
{

/**
 * Raised for unreadable or invalid configuration. The message lists every
 * violation, one path-qualified line each.
 */
class ConfigError : public std::runtime_error
{
    public:
        explicit ConfigError(const std::string &message);
        explicit ConfigError(const std::vector<std::string> &_errors);

        const std::vector<std::string> &getErrors() const { return errors; }

    private:
        std::vector<std::string> errors;

        static std::string join(const std::vector<std::string> &errors);
};

struct DaemonEndpoint
{
    std::string name;
    std::string host;
    int port;

    DaemonEndpoint() : port(0) {}
};

/**
 * Observatory address book: daemon names to network endpoints, machine
 * names to IP addresses.
 *
 * {
 *   "daemons": { "onemetre_telescope": { "host": "10.2.6.1", "port": 9003 } },
 *   "machines": { "OneMetreTCS": "10.2.6.1" }
 * }
 */
class AddressBook
{
    public:
        static AddressBook load(const std::string &path);
        static AddressBook parse(const std::string &text);

        void addDaemon(const std::string &name, const std::string &host, int port);
        void addMachine(const std::string &name, const std::string &ip);

        bool findDaemon(const std::string &name, DaemonEndpoint &out) const;
        bool findMachine(const std::string &name, std::string &ip) const;

    private:
        std::map<std::string, DaemonEndpoint> daemons;
        std::map<std::string, std::string> machines;
};

struct ParkPosition
{
    std::string name;
    std::string desc;
    // degrees
    double alt;
    double az;

    ParkPosition() : alt(0), az(0) {}
};

class Config
{
    public:
        /**
         * Reads and validates a config file.
         *
         * @throw ConfigError on a missing file, invalid json or any schema
         *        violation
         */
        static Config load(const std::string &path, const AddressBook &addresses);
        static Config parse(const std::string &text, const AddressBook &addresses);

        /**
         * Checks a parsed document against the config schema.
         *
         * @return violations as "path->to->field: message", sorted by path;
         *         empty when the document is valid
         */
        static std::vector<std::string> validate(const nlohmann::json &doc, const AddressBook &addresses);

        DaemonEndpoint daemon;
        std::string logName;
        std::vector<std::string> controlIps;
        bool virtualTelescope;

        double focusTolerance;
        double queryDelay;
        double initializationTimeout;
        double slewTimeout;
        double focusTimeout;
        double homingTimeout;
        double limitTimeout;
        double coverTimeout;
        double roofOpenTimeout;
        double roofCloseTimeout;
        double pingTimeout;

        bool hasRoof;
        bool hasCovers;
        bool hasFocus;

        // degrees, [min, max]
        double haSoftLimits[2];
        double decSoftLimits[2];

        std::vector<ParkPosition> parkPositions;

        LayoutVariant layout;

        bool hasSecuritySystem;
        DaemonEndpoint securitySystemDaemon;
        std::string securitySystemKey;

        const ParkPosition *findParkPosition(const std::string &name) const;
        bool isControlIp(const std::string &ip) const;

    private:
        Config();
};

}

#endif // __TALON_CONFIG_H__
