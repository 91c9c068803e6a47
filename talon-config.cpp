/*
 * Daemon configuration parsed from a json file
 *
 * Validation follows the jsonschema conventions the rest of the
 * observatory software uses: every violation is collected, messages are
 * prefixed with the "->" joined path of the offending value, and the list
 * is sorted by path before it is reported.
 */

#include "talon-config.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>

using namespace talon;
using nlohmann::json;

namespace
{

struct Violation
{
    std::vector<std::string> path;
    std::string message;

    std::string format() const
    {
        if (path.empty())
            return message;

        std::string out;
        for (size_t i = 0; i < path.size(); i++) {
            if (i > 0)
                out += "->";
            out += path[i];
        }
        return out + ": " + message;
    }

    bool operator<(const Violation &o) const { return path < o.path; }
};

enum ValueType
{
    TYPE_STRING,
    TYPE_NUMBER,
    TYPE_BOOLEAN,
    TYPE_ARRAY,
    TYPE_OBJECT
};

const char *typeName(ValueType type)
{
    switch (type) {
        case TYPE_STRING:  return "string";
        case TYPE_NUMBER:  return "number";
        case TYPE_BOOLEAN: return "boolean";
        case TYPE_ARRAY:   return "array";
        case TYPE_OBJECT:  return "object";
    }
    return "unknown";
}

bool isType(const json &value, ValueType type)
{
    switch (type) {
        case TYPE_STRING:  return value.is_string();
        case TYPE_NUMBER:  return value.is_number();
        case TYPE_BOOLEAN: return value.is_boolean();
        case TYPE_ARRAY:   return value.is_array();
        case TYPE_OBJECT:  return value.is_object();
    }
    return false;
}

std::string quoted(const std::string &s)
{
    return "'" + s + "'";
}

// numbers printed without trailing zeros, as jsonschema does
std::string numberText(double value)
{
    std::ostringstream os;
    os << value;
    return os.str();
}

class Validator
{
    public:
        explicit Validator(const AddressBook &_addresses) : addresses(_addresses) {}

        void error(const std::vector<std::string> &path, const std::string &message)
        {
            Violation v;
            v.path = path;
            v.message = message;
            violations.push_back(v);
        }

        bool checkType(const json &value, ValueType type, const std::vector<std::string> &path)
        {
            if (isType(value, type))
                return true;
            error(path, value.dump() + " is not of type " + quoted(typeName(type)));
            return false;
        }

        void checkRange(const json &value, double min, double max, const std::vector<std::string> &path)
        {
            if (!checkType(value, TYPE_NUMBER, path))
                return;
            double v = value.get<double>();
            if (v < min)
                error(path, value.dump() + " is less than the minimum of " + numberText(min));
            else if (v > max)
                error(path, value.dump() + " is greater than the maximum of " + numberText(max));
        }

        void checkDaemonName(const json &value, const std::vector<std::string> &path)
        {
            if (!checkType(value, TYPE_STRING, path))
                return;
            DaemonEndpoint unused;
            if (!addresses.findDaemon(value.get<std::string>(), unused))
                error(path, value.get<std::string>() + " is not a valid daemon name");
        }

        void checkMachineName(const json &value, const std::vector<std::string> &path)
        {
            if (!checkType(value, TYPE_STRING, path))
                return;
            std::string unused;
            if (!addresses.findMachine(value.get<std::string>(), unused))
                error(path, value.get<std::string>() + " is not a valid machine name");
        }

        void checkLimits(const json &value, double min, double max, const std::vector<std::string> &path)
        {
            if (!checkType(value, TYPE_ARRAY, path))
                return;
            if (value.size() < 2)
                error(path, value.dump() + " is too short");
            else if (value.size() > 2)
                error(path, value.dump() + " is too long");

            for (size_t i = 0; i < value.size(); i++) {
                std::vector<std::string> p = path;
                p.push_back(std::to_string(i));
                checkRange(value[i], min, max, p);
            }
        }

        // required keys present, no keys outside allowed
        void checkKeys(const json &object, const char *const *required, size_t requiredCount,
                       const char *const *optional, size_t optionalCount, const std::vector<std::string> &path)
        {
            for (size_t i = 0; i < requiredCount; i++)
                if (object.find(required[i]) == object.end())
                    error(path, quoted(required[i]) + " is a required property");

            std::vector<std::string> unexpected;
            for (json::const_iterator it = object.begin(); it != object.end(); ++it) {
                const char *const *r = std::find(required, required + requiredCount, it.key());
                const char *const *o = std::find(optional, optional + optionalCount, it.key());
                if (r == required + requiredCount && o == optional + optionalCount)
                    unexpected.push_back(quoted(it.key()));
            }

            if (!unexpected.empty()) {
                std::string list;
                for (size_t i = 0; i < unexpected.size(); i++)
                    list += (i > 0 ? ", " : "") + unexpected[i];
                error(path, "Additional properties are not allowed (" + list
                    + (unexpected.size() == 1 ? " was unexpected)" : " were unexpected)"));
            }
        }

        std::vector<std::string> result()
        {
            std::stable_sort(violations.begin(), violations.end());
            std::vector<std::string> out;
            for (size_t i = 0; i < violations.size(); i++)
                out.push_back(violations[i].format());
            return out;
        }

    private:
        const AddressBook &addresses;
        std::vector<Violation> violations;
};

const char *const requiredKeys[] = {
    "daemon", "log_name", "control_machines", "virtual", "focus_tolerance",
    "query_delay", "initialization_timeout", "slew_timeout", "focus_timeout",
    "homing_timeout", "limit_timeout", "cover_timeout", "roof_open_timeout",
    "roof_close_timeout", "ping_timeout", "park_positions",
    "has_roof", "has_covers", "has_focus", "ha_soft_limits", "dec_soft_limits"
};

const char *const optionalKeys[] = {
    "talon_layout", "security_system_daemon", "security_system_key"
};

const char *const numberKeys[] = {
    "focus_tolerance", "query_delay", "initialization_timeout", "slew_timeout",
    "focus_timeout", "homing_timeout", "limit_timeout", "cover_timeout",
    "roof_open_timeout", "roof_close_timeout", "ping_timeout"
};

const char *const booleanKeys[] = {
    "virtual", "has_roof", "has_covers", "has_focus"
};

const char *const parkRequiredKeys[] = { "desc", "alt", "az" };

#define COUNT(a) (sizeof(a) / sizeof(a[0]))

std::string readFile(const std::string &path)
{
    std::ifstream in(path.c_str());
    if (!in)
        throw ConfigError("unable to read " + path);

    std::ostringstream os;
    os << in.rdbuf();
    return os.str();
}

json parseJson(const std::string &text)
{
    try {
        return json::parse(text);
    } catch (const json::parse_error &e) {
        throw ConfigError(std::string("invalid json: ") + e.what());
    }
}

}

ConfigError::ConfigError(const std::string &message)
    : std::runtime_error(message)
{
    errors.push_back(message);
}

ConfigError::ConfigError(const std::vector<std::string> &_errors)
    : std::runtime_error(join(_errors)), errors(_errors)
{
}

std::string ConfigError::join(const std::vector<std::string> &errors)
{
    std::string message = "Invalid configuration:";
    for (size_t i = 0; i < errors.size(); i++)
        message += "\n\t" + errors[i];
    return message;
}

AddressBook AddressBook::load(const std::string &path)
{
    return parse(readFile(path));
}

AddressBook AddressBook::parse(const std::string &text)
{
    json doc = parseJson(text);
    if (!doc.is_object())
        throw ConfigError("address book must be a json object");

    AddressBook book;
    std::vector<std::string> errors;

    json::const_iterator daemons = doc.find("daemons");
    if (daemons != doc.end() && daemons->is_object()) {
        for (json::const_iterator it = daemons->begin(); it != daemons->end(); ++it) {
            const json &d = it.value();
            if (!d.is_object() || !d.contains("host") || !d["host"].is_string()
                || !d.contains("port") || !d["port"].is_number_integer()) {
                errors.push_back("daemons->" + it.key() + ": expected {\"host\": string, \"port\": integer}");
                continue;
            }
            book.addDaemon(it.key(), d["host"].get<std::string>(), d["port"].get<int>());
        }
    } else if (daemons != doc.end()) {
        errors.push_back("daemons: " + daemons->dump() + " is not of type 'object'");
    }

    json::const_iterator machines = doc.find("machines");
    if (machines != doc.end() && machines->is_object()) {
        for (json::const_iterator it = machines->begin(); it != machines->end(); ++it) {
            if (!it.value().is_string()) {
                errors.push_back("machines->" + it.key() + ": " + it.value().dump() + " is not of type 'string'");
                continue;
            }
            book.addMachine(it.key(), it.value().get<std::string>());
        }
    } else if (machines != doc.end()) {
        errors.push_back("machines: " + machines->dump() + " is not of type 'object'");
    }

    if (!errors.empty())
        throw ConfigError(errors);

    return book;
}

void AddressBook::addDaemon(const std::string &name, const std::string &host, int port)
{
    DaemonEndpoint d;
    d.name = name;
    d.host = host;
    d.port = port;
    daemons[name] = d;
}

void AddressBook::addMachine(const std::string &name, const std::string &ip)
{
    machines[name] = ip;
}

bool AddressBook::findDaemon(const std::string &name, DaemonEndpoint &out) const
{
    std::map<std::string, DaemonEndpoint>::const_iterator it = daemons.find(name);
    if (it == daemons.end())
        return false;
    out = it->second;
    return true;
}

bool AddressBook::findMachine(const std::string &name, std::string &ip) const
{
    std::map<std::string, std::string>::const_iterator it = machines.find(name);
    if (it == machines.end())
        return false;
    ip = it->second;
    return true;
}

Config::Config() :
    virtualTelescope(false),
    focusTolerance(0), queryDelay(0), initializationTimeout(0), slewTimeout(0),
    focusTimeout(0), homingTimeout(0), limitTimeout(0), coverTimeout(0),
    roofOpenTimeout(0), roofCloseTimeout(0), pingTimeout(0),
    hasRoof(false), hasCovers(false), hasFocus(false),
    layout(LAYOUT_LEGACY), hasSecuritySystem(false)
{
    haSoftLimits[0] = haSoftLimits[1] = 0;
    decSoftLimits[0] = decSoftLimits[1] = 0;
}

std::vector<std::string> Config::validate(const json &doc, const AddressBook &addresses)
{
    Validator v(addresses);
    const std::vector<std::string> root;

    if (!v.checkType(doc, TYPE_OBJECT, root))
        return v.result();

    v.checkKeys(doc, requiredKeys, COUNT(requiredKeys), optionalKeys, COUNT(optionalKeys), root);

    json::const_iterator it;

    if ((it = doc.find("daemon")) != doc.end())
        v.checkDaemonName(*it, std::vector<std::string>(1, "daemon"));

    if ((it = doc.find("log_name")) != doc.end())
        v.checkType(*it, TYPE_STRING, std::vector<std::string>(1, "log_name"));

    if ((it = doc.find("control_machines")) != doc.end()) {
        std::vector<std::string> path(1, "control_machines");
        if (v.checkType(*it, TYPE_ARRAY, path)) {
            for (size_t i = 0; i < it->size(); i++) {
                std::vector<std::string> p = path;
                p.push_back(std::to_string(i));
                v.checkMachineName((*it)[i], p);
            }
        }
    }

    for (size_t i = 0; i < COUNT(booleanKeys); i++)
        if ((it = doc.find(booleanKeys[i])) != doc.end())
            v.checkType(*it, TYPE_BOOLEAN, std::vector<std::string>(1, booleanKeys[i]));

    for (size_t i = 0; i < COUNT(numberKeys); i++)
        if ((it = doc.find(numberKeys[i])) != doc.end())
            v.checkRange(*it, 0, 1e300, std::vector<std::string>(1, numberKeys[i]));

    if ((it = doc.find("ha_soft_limits")) != doc.end())
        v.checkLimits(*it, -180, 180, std::vector<std::string>(1, "ha_soft_limits"));

    if ((it = doc.find("dec_soft_limits")) != doc.end())
        v.checkLimits(*it, -90, 90, std::vector<std::string>(1, "dec_soft_limits"));

    if ((it = doc.find("park_positions")) != doc.end()) {
        std::vector<std::string> path(1, "park_positions");
        if (v.checkType(*it, TYPE_OBJECT, path)) {
            for (json::const_iterator park = it->begin(); park != it->end(); ++park) {
                std::vector<std::string> p = path;
                p.push_back(park.key());
                if (!v.checkType(park.value(), TYPE_OBJECT, p))
                    continue;

                v.checkKeys(park.value(), parkRequiredKeys, COUNT(parkRequiredKeys), nullptr, 0, p);

                json::const_iterator field;
                std::vector<std::string> fp = p;
                fp.push_back("");
                if ((field = park->find("desc")) != park->end()) {
                    fp.back() = "desc";
                    v.checkType(*field, TYPE_STRING, fp);
                }
                if ((field = park->find("alt")) != park->end()) {
                    fp.back() = "alt";
                    v.checkRange(*field, 0, 90, fp);
                }
                if ((field = park->find("az")) != park->end()) {
                    fp.back() = "az";
                    v.checkRange(*field, 0, 360, fp);
                }
            }
        }
    }

    if ((it = doc.find("talon_layout")) != doc.end()) {
        std::vector<std::string> path(1, "talon_layout");
        LayoutVariant unused;
        if (v.checkType(*it, TYPE_STRING, path) && !parseLayoutVariant(it->get<std::string>(), unused))
            v.error(path, it->dump() + " is not one of ['legacy', 'compact']");
    }

    bool hasDaemon = doc.find("security_system_daemon") != doc.end();
    bool hasKey = doc.find("security_system_key") != doc.end();
    if (hasDaemon) {
        v.checkDaemonName(doc["security_system_daemon"], std::vector<std::string>(1, "security_system_daemon"));
        if (!hasKey)
            v.error(root, "'security_system_key' is a dependency of 'security_system_daemon'");
    }
    if (hasKey) {
        v.checkType(doc["security_system_key"], TYPE_STRING, std::vector<std::string>(1, "security_system_key"));
        if (!hasDaemon)
            v.error(root, "'security_system_daemon' is a dependency of 'security_system_key'");
    }

    return v.result();
}

Config Config::load(const std::string &path, const AddressBook &addresses)
{
    return parse(readFile(path), addresses);
}

Config Config::parse(const std::string &text, const AddressBook &addresses)
{
    json doc = parseJson(text);

    std::vector<std::string> errors = validate(doc, addresses);
    if (!errors.empty())
        throw ConfigError(errors);

    Config config;
    addresses.findDaemon(doc["daemon"].get<std::string>(), config.daemon);
    config.logName = doc["log_name"].get<std::string>();

    const json &machines = doc["control_machines"];
    for (size_t i = 0; i < machines.size(); i++) {
        std::string ip;
        addresses.findMachine(machines[i].get<std::string>(), ip);
        config.controlIps.push_back(ip);
    }

    config.virtualTelescope = doc["virtual"].get<bool>();
    config.focusTolerance = doc["focus_tolerance"].get<double>();
    config.queryDelay = doc["query_delay"].get<double>();
    config.initializationTimeout = doc["initialization_timeout"].get<double>();
    config.slewTimeout = doc["slew_timeout"].get<double>();
    config.focusTimeout = doc["focus_timeout"].get<double>();
    config.homingTimeout = doc["homing_timeout"].get<double>();
    config.limitTimeout = doc["limit_timeout"].get<double>();
    config.coverTimeout = doc["cover_timeout"].get<double>();
    config.roofOpenTimeout = doc["roof_open_timeout"].get<double>();
    config.roofCloseTimeout = doc["roof_close_timeout"].get<double>();
    config.pingTimeout = doc["ping_timeout"].get<double>();

    config.hasRoof = doc["has_roof"].get<bool>();
    config.hasCovers = doc["has_covers"].get<bool>();
    config.hasFocus = doc["has_focus"].get<bool>();

    for (int i = 0; i < 2; i++) {
        config.haSoftLimits[i] = doc["ha_soft_limits"][i].get<double>();
        config.decSoftLimits[i] = doc["dec_soft_limits"][i].get<double>();
    }

    const json &parks = doc["park_positions"];
    for (json::const_iterator it = parks.begin(); it != parks.end(); ++it) {
        ParkPosition p;
        p.name = it.key();
        p.desc = it.value()["desc"].get<std::string>();
        p.alt = it.value()["alt"].get<double>();
        p.az = it.value()["az"].get<double>();
        config.parkPositions.push_back(p);
    }

    if (doc.contains("talon_layout"))
        parseLayoutVariant(doc["talon_layout"].get<std::string>(), config.layout);

    if (doc.contains("security_system_daemon")) {
        config.hasSecuritySystem = true;
        addresses.findDaemon(doc["security_system_daemon"].get<std::string>(), config.securitySystemDaemon);
        config.securitySystemKey = doc["security_system_key"].get<std::string>();
    }

    return config;
}

const ParkPosition *Config::findParkPosition(const std::string &name) const
{
    for (size_t i = 0; i < parkPositions.size(); i++)
        if (parkPositions[i].name == name)
            return &parkPositions[i];
    return nullptr;
}

bool Config::isControlIp(const std::string &ip) const
{
    return std::find(controlIps.begin(), controlIps.end(), ip) != controlIps.end();
}
