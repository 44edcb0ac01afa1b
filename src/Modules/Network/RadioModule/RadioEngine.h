#pragma once
/**
 * @file RadioEngine.h
 * @brief Device-state synchronization engine for one UDP radio.
 *
 * Owns the device record (configuration, state machine, readings, poll
 * schedule) and dispatches both directions of the protocol:
 * - inbound datagrams are parsed, classified and folded into state/readings;
 * - outbound requests (poll ticks and user operations) are framed and sent
 *   through the RadioLink.
 *
 * The engine is single-threaded: `onDatagram`, `tick`, setters and operations
 * must all be called from the same task.
 */

#include <stddef.h>
#include <stdint.h>

#include "Core/Services/IRadio.h"
#include "Core/SystemLimits.h"
#include "Modules/Network/RadioModule/RadioAddress.h"
#include "Modules/Network/RadioModule/RadioFrame.h"
#include "Modules/Network/RadioModule/RadioLink.h"
#include "Modules/Network/RadioModule/RadioPollScheduler.h"
#include "Modules/Network/RadioModule/RadioProtocol.h"
#include "Modules/Network/RadioModule/RadioReadings.h"
#include "Modules/Network/RadioModule/RadioStateMachine.h"

/** @brief What happened to an inbound datagram. */
enum class RadioRxResult : uint8_t {
    Applied,
    /** Empty, not `RESPONSE:ACK`, or no `COMMAND`. */
    NotAck,
    UnknownVerb,
    /** Identity token missing or not ours. */
    ForeignId,
    /** Notification or discovery reply from another device. */
    ForeignIp,
    /** Discovery reply ignored while the host is unresolvable. */
    HostErrorDrop,
    /** Notification with an event outside the known set. */
    UnknownEvent
};

const char* radioRxResultName(RadioRxResult r);

struct RadioConfig {
    char identity[Limits::Radio::IdentityLen];
    char host[Limits::Radio::HostLen];
    /** Broadcast override; empty means "derive from the resolved host". */
    char broadcastAddress[Limits::Radio::HostLen];
    uint16_t udpPort;
    uint16_t listenPort;
    uint32_t timerSec;
    uint32_t fullUpdateSec;
};

/** @brief Defaults: no host, derived broadcast, ports 4244/4242, 60 s poll, daily full refresh. */
RadioConfig radioDefaultConfig();

struct RadioEngineObserver {
    /** Batched readings notification, bit `i` set for reading `i`. Mask may be 0 when only the status changed. */
    void (*onReadingsChanged)(void* ctx, uint64_t changedMask);
    void (*onStatusChanged)(void* ctx, RadioStatus status);
    void* ctx;
};

class RadioEngine {
public:
    RadioEngine(RadioLink& link, const RadioResolver& resolver);

    void setObserver(const RadioEngineObserver& observer) { observer_ = observer; }

    /**
     * @brief Register the device: start the listener, apply the host and make
     * the first poll due immediately.
     * @return setHost result (a listener failure is logged only).
     */
    RadioSvcStatus begin(const RadioConfig& cfg, uint32_t nowMs, char* msg, size_t msgLen);
    /** @brief Release the listener, then cancel the wake-up. */
    void end();
    bool running() const { return running_; }

    /**
     * @brief Configure the host. Empty clears the known IP; otherwise the name
     * is resolved and the broadcast address derived. Both end in `offline`.
     * @return RADIO_SVC_ERR_RESOLVE with a message in `msg` when resolution fails
     * (status becomes `host_error`).
     */
    RadioSvcStatus setHost(const char* host, uint32_t nowMs, char* msg, size_t msgLen);
    void setBroadcastAddress(const char* address);
    void setUdpPort(uint16_t port);
    /** @brief Change the listen port; a running listener is stopped, then restarted. */
    bool setListenPort(uint16_t port);
    /** @brief Change the poll interval; only a shorter interval reschedules the pending wake-up. */
    void setTimerSec(uint32_t sec, uint32_t nowMs);
    void setFullUpdateSec(uint32_t sec);
    void setIdentity(const char* identity);

    RadioRxResult onDatagram(const char* data, size_t len, uint32_t nowMs);

    /** @brief Run the poll when due. Returns the action taken (None when not due). */
    RadioPollAction tick(uint32_t nowMs);

    RadioSvcStatus powerOn();
    RadioSvcStatus powerOff();
    /** @brief Absolute volume, 0..31. */
    RadioSvcStatus setVolume(int32_t volume);
    /** @brief Relative volume step from the cached level, result must stay in 0..31. */
    RadioSvcStatus volumeStep(int8_t delta);
    RadioSvcStatus setMute(bool mute);
    /** @brief `radio`, `tunein`, `upnp`, `aux` or `station_1`..`station_8`. */
    RadioSvcStatus playMode(const char* mode);
    RadioSvcStatus playStation(uint8_t station);
    /** @brief Play the preset whose cached name equals `name`. */
    RadioSvcStatus playStationName(const char* name);
    /** @brief Play a `[name|]url` stream. */
    RadioSvcStatus playUrl(const char* descriptor);
    RadioSvcStatus requestStatus();
    RadioSvcStatus requestFullUpdate();
    RadioSvcStatus requestDiscover();

    RadioStatus status() const { return sm_.status(); }
    const RadioStateMachine& stateMachine() const { return sm_; }
    const RadioReadings& readings() const { return readings_; }
    const RadioPollScheduler& scheduler() const { return sched_; }
    const RadioConfig& config() const { return cfg_; }
    /** @brief Configured override, else derived subnet broadcast, else 255.255.255.255. */
    const char* broadcastAddress() const;

private:
    RadioSvcStatus sendCommand_(const char* verb, const char* const* params, size_t count);
    RadioSvcStatus broadcastCommand_(const char* verb, const char* const* params, size_t count);
    RadioSvcStatus sendGetBlocks_(const char* const* blocks, uint8_t count);
    bool frame_(const char* verb, const char* const* params, size_t count, size_t& lenOut);

    bool updateStatus_(RadioStatus next);
    bool updateVolume_(int32_t volume);
    bool applyReadings_(const char* block);

    RadioRxResult processSetAck_();
    RadioRxResult processNotification_();
    RadioRxResult processDiscover_();

    static void onReadingsSink_(void* ctx, uint64_t changedMask);

    RadioLink& link_;
    RadioResolver resolver_;
    RadioEngineObserver observer_{};
    RadioConfig cfg_{};
    char derivedBroadcast_[Limits::Radio::HostLen] = {0};

    RadioFrame rx_;
    char tx_[Limits::Radio::TxFrameLen] = {0};
    RadioReadings readings_;
    RadioStateMachine sm_;
    RadioPollScheduler sched_;

    /** Last non-muted volume, restored on unmute. */
    int32_t lastAudibleVolume_ = -1;
    /** Set once discovery succeeded for the current host. */
    bool acquired_ = false;
    bool running_ = false;
    /** Time of the event being dispatched, used for acknowledgment stamps. */
    uint32_t nowMs_ = 0;
};
