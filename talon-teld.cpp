/*
 * Talon telescope driver for RTS2
 *
 * Attaches talon's TelStatShm segment read-only and republishes it on
 * every info() call: position, site, axis limits and the talon state
 * enums. Motion is owned by talon itself; the motion entry points of the
 * Telescope interface are refused.
 *
 * How to use:
 *   rts2-teld-talon --talon-config /etc/talond/onemetre.json \
 *                   --address-book /etc/talond/addresses.json
 *   - Set env TALON_TELD_DEBUG=1 for a log line per poll
 */

#include "talon-teld.h"

#include <libnova/julian_day.h>

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <sstream>

#define OPT_TALON_CONFIG    OPT_LOCAL + 301
#define OPT_ADDRESS_BOOK    OPT_LOCAL + 302
#define OPT_SHM_KEY         OPT_LOCAL + 303

// talon reports elevation in earth radii
#define EARTH_RADIUS_M      6.37816e6

using namespace rts2teld;

Talon::Talon(int argc, char** argv)
    : Telescope(argc, argv,
                false,  // diffTrack
                true,   // hasTracking
                0,      // hasUnTelCoordinates
                false,  // hasAltAzDiff
                false,  // parkingBlock
                false)  // hasDerotators
{
    shmKey = talon::TELSTAT_SHM_KEY;

    haveSnapshot = false;
    lastAcceptedJd = 0;
    siteLocationSet = false;
    reportedUnreachable = false;
    debugEnabled = (getenv("TALON_TELD_DEBUG") != nullptr);

    createValue(talonReachable, "talon_reachable", "talon shared memory is attached and current", false);
    talonReachable->setValueBool(false);

    createValue(layoutName, "talon_layout", "talon shared memory layout", false);
    layoutName->setValueCharArr("");

    createValue(telState, "tel_state", "talon telescope state", false);
    telState->setValueCharArr(talon::telStateLabel(talon::TEL_ABSENT).c_str());

    createValue(coverState, "cover_state", "mirror cover state", false);
    coverState->setValueCharArr(talon::coverStateLabel(talon::COVER_ABSENT).c_str());

    createValue(roofState, "roof_state", "roof (dome shutter) state", false);
    roofState->setValueCharArr(talon::roofStateLabel(talon::ROOF_ABSENT).c_str());

    createValue(raAxisState, "ra_axis", "RA axis state", false);
    raAxisState->setValueCharArr(talon::focusStateLabel(talon::FOCUS_ABSENT).c_str());

    createValue(decAxisState, "dec_axis", "Dec axis state", false);
    decAxisState->setValueCharArr(talon::focusStateLabel(talon::FOCUS_ABSENT).c_str());

    createValue(focusState, "focus_state", "focuser state", false);
    focusState->setValueCharArr(talon::focusStateLabel(talon::FOCUS_ABSENT).c_str());

    createValue(readiness, "readiness", "command status of the readiness check", false);
    readiness->setValueInteger(talon::STATUS_TELESCOPE_NOT_INITIALIZED);

    createValue(talonPid, "talon_pid", "pid of the talon telescope daemon", false);
    talonPid->setValueInteger(0);

    createValue(heartbeatRemaining, "heartbeat", "dome heartbeat countdown", false);
    heartbeatRemaining->setValueInteger(0);

    createValue(talonMjd, "talon_mjd", "talon timestamp (libastro MJD)", false);
    talonMjd->setValueDouble(0);

    createValue(focusPosition, "focus_position", "focuser position", true);
    focusPosition->setValueDouble(0);

    createValue(raPosLimit, "ra_pos_limit", "RA axis positive limit", false);
    createValue(raNegLimit, "ra_neg_limit", "RA axis negative limit", false);
    createValue(decPosLimit, "dec_pos_limit", "Dec axis positive limit", false);
    createValue(decNegLimit, "dec_neg_limit", "Dec axis negative limit", false);

    addOption(OPT_TALON_CONFIG, "talon-config", 1, "daemon json configuration file");
    addOption(OPT_ADDRESS_BOOK, "address-book", 1, "json file mapping daemon and machine names to addresses");
    addOption(OPT_SHM_KEY, "shm-key", 1, "talon shared memory key (default 0x4e56361a)");
}

Talon::~Talon()
{
    // decoder borrows nothing from the segment, order does not matter
    decoder.reset();
    segment.reset();
}

int Talon::processOption(int opt)
{
    switch (opt) {
        case OPT_TALON_CONFIG:
            configPath = optarg;
            return 0;
        case OPT_ADDRESS_BOOK:
            addressBookPath = optarg;
            return 0;
        case OPT_SHM_KEY:
        {
            char *end = nullptr;
            long key = strtol(optarg, &end, 0);
            if (end == optarg || *end != '\0') {
                logStream(MESSAGE_ERROR) << "invalid shared memory key " << optarg << sendLog;
                return -1;
            }
            shmKey = static_cast<key_t>(key);
            return 0;
        }
        default:
            return Telescope::processOption(opt);
    }
}

int Talon::initHardware()
{
    if (configPath.empty() || addressBookPath.empty()) {
        logStream(MESSAGE_ERROR) << "both --talon-config and --address-book must be given" << sendLog;
        return -1;
    }

    try {
        talon::AddressBook addresses = talon::AddressBook::load(addressBookPath);
        config.reset(new talon::Config(talon::Config::load(configPath, addresses)));
    } catch (const talon::ConfigError &e) {
        logStream(MESSAGE_ERROR) << "cannot load " << configPath << ": " << e.what() << sendLog;
        return -1;
    }

    const talon::LayoutTable &layout = talon::layoutFor(config->layout);
    decoder.reset(new talon::SnapshotDecoder(layout, config->hasRoof, config->hasCovers, config->hasFocus));
    segment.reset(new talon::SharedSegment(shmKey));

    layoutName->setValueCharArr(layout.getName());
    // Telescope re-applies refresh_idle after moves and on change
    rts2core::Value *refresh = getOwnValue("refresh_idle");
    if (refresh && refresh->getValueBaseType() == RTS2_VALUE_DOUBLE)
        ((rts2core::ValueDouble *) refresh)->setValueDouble(config->queryDelay);
    else
        logStream(MESSAGE_WARNING) << "refresh_idle not found, query_delay applies until the next move" << sendLog;
    setIdleInfoInterval(config->queryDelay);

    logStream(MESSAGE_INFO) << "talon driver " << config->daemon.name << " (" << config->logName
        << "): layout " << layout.getName()
        << ", roof " << (config->hasRoof ? "yes" : "no")
        << ", covers " << (config->hasCovers ? "yes" : "no")
        << ", focus " << (config->hasFocus ? "yes" : "no") << sendLog;

    if (config->virtualTelescope)
        logStream(MESSAGE_WARNING) << "configured as virtual telescope; talon is expected to run in simulation" << sendLog;

    // talon may start after us; info() keeps trying
    std::string reason;
    if (!ensureAttached(reason))
        markUnreachable(reason, MESSAGE_WARNING);

    return 0;
}

int Talon::info()
{
    if (!decoder)
        return -1;

    talon::TelescopeSnapshot snapshot;
    if (!readSnapshot(snapshot))
        return 0;

    if (isStale(snapshot))
        return 0;

    if (reportedUnreachable) {
        logStream(MESSAGE_INFO) << "talon reachable again" << sendLog;
        maskState(DEVICE_ERROR_MASK, 0, "talon reachable");
        reportedUnreachable = false;
    }
    talonReachable->setValueBool(true);

    logTransitions(snapshot);
    publish(snapshot);

    last = snapshot;
    lastAcceptedJd = ln_get_julian_from_sys();
    haveSnapshot = true;

    if (snapshot.has(talon::FIELD_LST))
        return infoLST(decoder->getLayout().toDegrees(snapshot.lst));
    return Telescope::info();
}

bool Talon::ensureAttached(std::string &reason)
{
    if (segment->isAttached() && segment->isCurrent())
        return true;

    if (segment->isAttached())
        logStream(MESSAGE_WARNING) << "talon shared memory segment was removed, re-attaching" << sendLog;

    if (!segment->attach()) {
        std::ostringstream os;
        os << "cannot attach talon shared memory 0x" << std::hex << shmKey << std::dec << ": " << strerror(errno);
        reason = os.str();
        return false;
    }

    size_t required = decoder->getLayout().requiredSize();
    logStream(MESSAGE_INFO) << "attached talon shared memory 0x" << std::hex << shmKey << std::dec
        << " (" << segment->size() << " bytes, layout needs " << required << ")" << sendLog;
    if (segment->size() < required)
        logStream(MESSAGE_WARNING) << "talon segment is smaller than the " << decoder->getLayout().getName()
            << " layout; check talon_layout in " << configPath << sendLog;
    return true;
}

bool Talon::readSnapshot(talon::TelescopeSnapshot &snapshot)
{
    std::string reason;
    if (!ensureAttached(reason)) {
        markUnreachable(reason);
        return false;
    }

    talon::DecodeError error;
    if (!decoder->decode(*segment, snapshot, &error)) {
        markUnreachable(error.describe());
        return false;
    }

    if (haveSnapshot) {
        double window = talon::consistencyWindow(lastAcceptedJd, ln_get_julian_from_sys(), config->pingTimeout);
        if (!talon::snapshotsConsistent(last, snapshot, window)) {
            // the writer may have been mid update; one re-read
            if (debugEnabled)
                logStream(MESSAGE_DEBUG) << "inconsistent snapshot (mjd " << last.mjd << " -> " << snapshot.mjd
                    << "), reading again" << sendLog;

            if (!decoder->decode(*segment, snapshot, &error)) {
                markUnreachable(error.describe());
                return false;
            }
            if (!talon::snapshotsConsistent(last, snapshot, window))
                logStream(MESSAGE_WARNING) << "talon clock jumped from mjd " << last.mjd << " to " << snapshot.mjd << sendLog;
        }
    }

    if (snapshot.has(talon::FIELD_PID) && snapshot.pid > 0 && kill(snapshot.pid, 0) < 0 && errno == ESRCH) {
        std::ostringstream os;
        os << "talon telescope daemon (pid " << snapshot.pid << ") is not running";
        markUnreachable(os.str());
        return false;
    }

    if (debugEnabled)
        logStream(MESSAGE_DEBUG) << "snapshot mjd " << snapshot.mjd << " state "
            << talon::telStateLabel(snapshot.telState) << sendLog;

    return true;
}

bool Talon::isStale(const talon::TelescopeSnapshot &snapshot)
{
    double age = (ln_get_julian_from_sys() - snapshot.jd()) * 86400.0;
    if (age <= config->pingTimeout)
        return false;

    std::ostringstream os;
    os << "talon status is " << age << " s old (ping timeout " << config->pingTimeout << " s)";
    markUnreachable(os.str(), MESSAGE_WARNING);
    return true;
}

void Talon::markUnreachable(const std::string &reason, messageType_t type)
{
    if (!reportedUnreachable) {
        logStream(type) << talon::commandStatusMessage(talon::STATUS_CANNOT_COMMUNICATE_WITH_TELESCOPE)
            << ": " << reason << sendLog;
        maskState(DEVICE_ERROR_MASK, DEVICE_ERROR_HW, reason.c_str());
    }
    reportedUnreachable = true;
    // the next good read starts a new tear check baseline
    haveSnapshot = false;

    talonReachable->setValueBool(false);
    // a default snapshot has every state ABSENT
    publishStates(talon::TelescopeSnapshot());
    readiness->setValueInteger(talon::STATUS_CANNOT_COMMUNICATE_WITH_TELESCOPE);
}

void Talon::publishStates(const talon::TelescopeSnapshot &snapshot)
{
    telState->setValueCharArr(talon::telStateLabel(snapshot.telState).c_str());
    coverState->setValueCharArr(talon::coverStateLabel(snapshot.coverState).c_str());
    roofState->setValueCharArr(talon::roofStateLabel(snapshot.roofState).c_str());
    raAxisState->setValueCharArr(talon::focusStateLabel(snapshot.axes[talon::AXIS_RA].state).c_str());
    decAxisState->setValueCharArr(talon::focusStateLabel(snapshot.axes[talon::AXIS_DEC].state).c_str());
    focusState->setValueCharArr(talon::focusStateLabel(snapshot.axes[talon::AXIS_FOCUS].state).c_str());
    readiness->setValueInteger(talon::readinessStatus(snapshot));
}

void Talon::publish(const talon::TelescopeSnapshot &snapshot)
{
    const talon::LayoutTable &layout = decoder->getLayout();

    if (!siteLocationSet) {
        setTelLongLat(layout.toDegrees(snapshot.longitude), layout.toDegrees(snapshot.latitude));
        setTelAltitude(snapshot.elevation * EARTH_RADIUS_M);
        siteLocationSet = true;

        logStream(MESSAGE_INFO) << "site from talon: lat=" << layout.toDegrees(snapshot.latitude)
            << " lon=" << layout.toDegrees(snapshot.longitude)
            << " elevation=" << snapshot.elevation * EARTH_RADIUS_M << "m" << sendLog;
    }

    setTelRaDec(layout.toDegrees(snapshot.raJ2000), layout.toDegrees(snapshot.decJ2000));

    talonMjd->setValueDouble(snapshot.mjd);
    publishStates(snapshot);

    raPosLimit->setValueDouble(layout.toDegrees(snapshot.axes[talon::AXIS_RA].posLimit));
    raNegLimit->setValueDouble(layout.toDegrees(snapshot.axes[talon::AXIS_RA].negLimit));
    decPosLimit->setValueDouble(layout.toDegrees(snapshot.axes[talon::AXIS_DEC].posLimit));
    decNegLimit->setValueDouble(layout.toDegrees(snapshot.axes[talon::AXIS_DEC].negLimit));

    if (snapshot.has(talon::FIELD_FOCUS_CPOS))
        focusPosition->setValueDouble(snapshot.focusCurrentPosition);
    if (snapshot.has(talon::FIELD_PID))
        talonPid->setValueInteger(snapshot.pid);
    if (snapshot.has(talon::FIELD_HEARTBEAT_REMAINING))
        heartbeatRemaining->setValueInteger(snapshot.heartbeatRemaining);
}

void Talon::logTransitions(const talon::TelescopeSnapshot &snapshot)
{
    if (!haveSnapshot) {
        logStream(MESSAGE_INFO) << "telescope " << talon::telStateLabel(snapshot.telState)
            << ", covers " << talon::coverStateLabel(snapshot.coverState)
            << ", roof " << talon::roofStateLabel(snapshot.roofState)
            << ", focus " << talon::focusStateLabel(snapshot.axes[talon::AXIS_FOCUS].state) << sendLog;
        return;
    }

    if (snapshot.telState != last.telState)
        logStream(MESSAGE_INFO) << "telescope state " << talon::telStateLabel(last.telState)
            << " -> " << talon::telStateLabel(snapshot.telState) << sendLog;

    if (snapshot.telState == talon::TEL_UNKNOWN && snapshot.telStateCode != last.telStateCode)
        logStream(MESSAGE_WARNING) << "unrecognised talon telescope state " << snapshot.telStateCode << sendLog;

    if (snapshot.coverState != last.coverState)
        logStream(MESSAGE_INFO) << "cover state " << talon::coverStateLabel(last.coverState)
            << " -> " << talon::coverStateLabel(snapshot.coverState) << sendLog;

    if (snapshot.roofState != last.roofState)
        logStream(MESSAGE_INFO) << "roof state " << talon::roofStateLabel(last.roofState)
            << " -> " << talon::roofStateLabel(snapshot.roofState) << sendLog;

    if (snapshot.axes[talon::AXIS_FOCUS].state != last.axes[talon::AXIS_FOCUS].state)
        logStream(MESSAGE_INFO) << "focus state " << talon::focusStateLabel(last.axes[talon::AXIS_FOCUS].state)
            << " -> " << talon::focusStateLabel(snapshot.axes[talon::AXIS_FOCUS].state) << sendLog;
}

int Talon::notAvailable(const char *command)
{
    logStream(MESSAGE_ERROR) << command << ": "
        << talon::commandStatusMessage(talon::STATUS_COMMAND_NOT_AVAILABLE) << sendLog;
    return -1;
}

int Talon::startResync()
{
    return notAvailable("startResync");
}

int Talon::isMoving()
{
    return -2;
}

int Talon::stopMove()
{
    return notAvailable("stopMove");
}

int Talon::startPark()
{
    return notAvailable("startPark");
}

int Talon::endPark()
{
    return 0;
}

int Talon::isParking()
{
    return -2;
}

int Talon::setTo(double set_ra, double set_dec)
{
    (void)set_ra;
    (void)set_dec;
    return notAvailable("setTo");
}

int Talon::correct(double cor_ra, double cor_dec, double real_ra, double real_dec)
{
    (void)cor_ra;
    (void)cor_dec;
    (void)real_ra;
    (void)real_dec;
    return notAvailable("correct");
}

int main(int argc, char** argv)
{
    Talon device(argc, argv);
    return device.run();
}
