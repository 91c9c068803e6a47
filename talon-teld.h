/*
 * Talon telescope driver for RTS2
 *
 * Read-only mount driver: reports the state talon exports through its
 * TelStatShm shared memory segment.
 */

#ifndef __RTS2_TALON_TELD_H__
#define __RTS2_TALON_TELD_H__

#include "teld.h"

#include "talon-config.h"
#include "talon-data.h"
#include "talon-shm.h"

#include <memory>
#include <string>

namespace rts2teld
{

class Talon : public Telescope
{
    public:
        Talon(int argc, char **argv);
        virtual ~Talon();

    protected:
        virtual int processOption(int opt);
        virtual int initHardware();
        virtual int info();

        virtual int startResync();
        virtual int isMoving();
        virtual int stopMove();
        virtual int startPark();
        virtual int endPark();
        virtual int isParking();

        virtual int setTo(double set_ra, double set_dec);
        virtual int correct(double cor_ra, double cor_dec, double real_ra, double real_dec);

    private:
        // Options
        std::string configPath;
        std::string addressBookPath;
        key_t shmKey;

        std::unique_ptr<talon::Config> config;
        std::unique_ptr<talon::SharedSegment> segment;
        std::unique_ptr<talon::SnapshotDecoder> decoder;

        talon::TelescopeSnapshot last;
        bool haveSnapshot;
        // host JD when last was accepted
        double lastAcceptedJd;
        bool siteLocationSet;
        bool reportedUnreachable;
        bool debugEnabled;

        bool ensureAttached(std::string &reason);
        bool readSnapshot(talon::TelescopeSnapshot &snapshot);
        bool isStale(const talon::TelescopeSnapshot &snapshot);
        void markUnreachable(const std::string &reason, messageType_t type = MESSAGE_ERROR);
        void publish(const talon::TelescopeSnapshot &snapshot);
        void publishStates(const talon::TelescopeSnapshot &snapshot);
        void logTransitions(const talon::TelescopeSnapshot &snapshot);
        int notAvailable(const char *command);

        // RTS2 values
        rts2core::ValueString *layoutName;
        rts2core::ValueString *telState;
        rts2core::ValueString *coverState;
        rts2core::ValueString *roofState;
        rts2core::ValueString *raAxisState;
        rts2core::ValueString *decAxisState;
        rts2core::ValueString *focusState;
        rts2core::ValueInteger *readiness;
        rts2core::ValueInteger *talonPid;
        rts2core::ValueInteger *heartbeatRemaining;
        rts2core::ValueDouble *talonMjd;
        rts2core::ValueDouble *focusPosition;
        rts2core::ValueDouble *raPosLimit;
        rts2core::ValueDouble *raNegLimit;
        rts2core::ValueDouble *decPosLimit;
        rts2core::ValueDouble *decNegLimit;
        rts2core::ValueBool *talonReachable;
};

}

#endif // __RTS2_TALON_TELD_H__
