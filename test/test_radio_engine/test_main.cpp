#include <unity.h>
#include <string.h>

#include "Modules/Network/RadioModule/RadioEngine.h"
#include "../support/FakeRadioLink.h"

struct ObserverLog {
    uint32_t readingsCalls;
    uint64_t lastMask;
    uint32_t statusCalls;
    RadioStatus lastStatus;
};

static ObserverLog gObs{};

static void onReadings(void*, uint64_t mask)
{
    ++gObs.readingsCalls;
    gObs.lastMask = mask;
}

static void onStatus(void*, RadioStatus st)
{
    ++gObs.statusCalls;
    gObs.lastStatus = st;
}

static FakeRadioLink gLinkStore;
static RadioEngine gEngineStore(gLinkStore, RadioResolver{fakeResolve, nullptr});
static FakeRadioLink* const gLink = &gLinkStore;
static RadioEngine* const gEngine = &gEngineStore;

static RadioRxResult feed(const char* text, uint32_t nowMs)
{
    return gEngine->onDatagram(text, strlen(text), nowMs);
}

static RadioSvcStatus startWithHost(const char* host, char* msg = nullptr, size_t msgLen = 0)
{
    RadioConfig cfg = radioDefaultConfig();
    snprintf(cfg.host, sizeof(cfg.host), "%s", host);
    return gEngine->begin(cfg, 0, msg, msgLen);
}

static const char* reading(RadioReading r)
{
    return gEngine->readings().get(r);
}

static const char kDiscoverReply[] =
    "RESPONSE:ACK\r\nCOMMAND:DISCOVER\r\nIP:10.0.0.5\r\nNAME:Radio1\r\n";
static const char kPowerOnReply[] =
    "RESPONSE:ACK\r\nCOMMAND:GET\r\nPOWER_STATUS\r\nPOWER:ON\r\nENERGY_MODE:PREMIUM\r\nID:flowradio\r\n";
static const char kVolume12Reply[] =
    "RESPONSE:ACK\r\nCOMMAND:GET\r\nVOLUME\r\nVOLUME_SET:12\r\nID:flowradio\r\n";
static const char kGetVolumeFrame[] = "COMMAND:GET\r\nVOLUME\r\nID:flowradio\r\n\r\n";

/** Discovered at 10.0.0.5 and powered on. */
static void bringUpPoweredOn()
{
    TEST_ASSERT_EQUAL(RADIO_SVC_OK, startWithHost("10.0.0.5"));
    gEngine->tick(0);
    TEST_ASSERT_EQUAL(RadioRxResult::Applied, feed(kDiscoverReply, 100));
    TEST_ASSERT_EQUAL(RadioRxResult::Applied, feed(kPowerOnReply, 200));
    TEST_ASSERT_TRUE(gEngine->status() == RadioStatus::On);
    gLink->clearSent();
}

void setUp()
{
    gEngine->end();
    gLink->reset();
    gObs = ObserverLog{};
    gEngine->setObserver(RadioEngineObserver{onReadings, onStatus, nullptr});
}

void tearDown()
{
    gEngine->end();
}

void test_discovery_end_to_end()
{
    TEST_ASSERT_EQUAL(RADIO_SVC_OK, startWithHost("10.0.0.5"));
    TEST_ASSERT_TRUE(gEngine->status() == RadioStatus::Offline);
    TEST_ASSERT_EQUAL_STRING("10.0.0.5", reading(RadioReading::IpAddress));
    TEST_ASSERT_EQUAL_STRING("10.0.0.255", gEngine->broadcastAddress());
    TEST_ASSERT_TRUE(gLink->listening());
    TEST_ASSERT_EQUAL_UINT16(RadioDefaults::ListenPort, gLink->listenPort);

    TEST_ASSERT_TRUE(gEngine->tick(0) == RadioPollAction::Discover);
    TEST_ASSERT_EQUAL_UINT8(1, gLink->sentCount);
    TEST_ASSERT_TRUE(gLink->sent[0].broadcast);
    TEST_ASSERT_EQUAL_STRING("10.0.0.255", gLink->sent[0].target);
    TEST_ASSERT_EQUAL_UINT16(RadioDefaults::UdpPort, gLink->sent[0].port);
    TEST_ASSERT_EQUAL_STRING("COMMAND:DISCOVER\r\n\r\nID:flowradio\r\n\r\n", gLink->sent[0].payload);

    TEST_ASSERT_EQUAL(RadioRxResult::Applied, feed(kDiscoverReply, 100));
    TEST_ASSERT_TRUE(gEngine->status() == RadioStatus::Online);
    TEST_ASSERT_EQUAL_STRING("Radio1", reading(RadioReading::DeviceName));
    TEST_ASSERT_EQUAL_UINT8(1 + RADIO_FULL_BLOCK_COUNT, gLink->sentCount);
    TEST_ASSERT_FALSE(gLink->sent[1].broadcast);
    TEST_ASSERT_EQUAL_STRING("10.0.0.5", gLink->sent[1].target);
    TEST_ASSERT_EQUAL_STRING("COMMAND:GET\r\nPOWER_STATUS\r\nID:flowradio\r\n\r\n", gLink->sent[1].payload);

    // Already acquired: a repeated reply does not trigger another full refresh.
    TEST_ASSERT_EQUAL(RadioRxResult::Applied, feed(kDiscoverReply, 150));
    TEST_ASSERT_EQUAL_UINT8(1 + RADIO_FULL_BLOCK_COUNT, gLink->sentCount);
}

void test_poll_after_acquisition_is_status_refresh()
{
    bringUpPoweredOn();
    TEST_ASSERT_TRUE(gEngine->tick(60000) == RadioPollAction::StatusRefresh);
    TEST_ASSERT_EQUAL_UINT8(RADIO_STATUS_BLOCK_COUNT, gLink->sentCount);
}

void test_volume_changed_notification_sends_single_get_volume()
{
    bringUpPoweredOn();
    const uint32_t before = gObs.readingsCalls;

    TEST_ASSERT_EQUAL(RadioRxResult::Applied,
                      feed("RESPONSE:ACK\r\nCOMMAND:NOTIFICATION\r\nEVENT:VOLUME_CHANGED\r\nIP:10.0.0.5\r\n", 300));
    TEST_ASSERT_EQUAL_UINT8(1, gLink->sentCount);
    TEST_ASSERT_EQUAL_STRING(kGetVolumeFrame, gLink->sent[0].payload);
    TEST_ASSERT_EQUAL_UINT32(before, gObs.readingsCalls);
    TEST_ASSERT_TRUE(gEngine->status() == RadioStatus::On);
}

void test_power_notifications_drive_status()
{
    bringUpPoweredOn();
    feed("RESPONSE:ACK\r\nCOMMAND:NOTIFICATION\r\nEVENT:POWER_OFF\r\nIP:10.0.0.5\r\n", 300);
    TEST_ASSERT_TRUE(gEngine->status() == RadioStatus::Off);
    TEST_ASSERT_EQUAL_STRING("off", reading(RadioReading::Power));
    TEST_ASSERT_TRUE(gObs.lastStatus == RadioStatus::Off);

    feed("RESPONSE:ACK\r\nCOMMAND:NOTIFICATION\r\nEVENT:POWER_ON\r\nIP:10.0.0.5\r\n", 400);
    TEST_ASSERT_TRUE(gEngine->status() == RadioStatus::On);
}

void test_mute_then_unmute_reconciles_volume()
{
    bringUpPoweredOn();
    feed(kVolume12Reply, 300);
    TEST_ASSERT_EQUAL_STRING("12", reading(RadioReading::Volume));
    TEST_ASSERT_EQUAL_STRING("off", reading(RadioReading::Mute));
    const uint32_t base = gObs.readingsCalls;

    feed("RESPONSE:ACK\r\nCOMMAND:SET\r\nVOLUME_MUTE\r\nID:flowradio\r\n", 400);
    TEST_ASSERT_EQUAL_STRING("-1", reading(RadioReading::Volume));
    TEST_ASSERT_EQUAL_STRING("on", reading(RadioReading::Mute));
    TEST_ASSERT_EQUAL_UINT32(base + 1, gObs.readingsCalls);

    gLink->clearSent();
    feed("RESPONSE:ACK\r\nCOMMAND:SET\r\nVOLUME_UNMUTE\r\nID:flowradio\r\n", 500);
    TEST_ASSERT_EQUAL_STRING("12", reading(RadioReading::Volume));
    TEST_ASSERT_EQUAL_STRING("off", reading(RadioReading::Mute));
    TEST_ASSERT_EQUAL_UINT32(base + 1, gObs.readingsCalls);
    TEST_ASSERT_EQUAL_UINT8(1, gLink->sentCount);
    TEST_ASSERT_EQUAL_STRING(kGetVolumeFrame, gLink->sent[0].payload);

    // Authoritative value equal to the restored one: still silent.
    feed(kVolume12Reply, 600);
    TEST_ASSERT_EQUAL_UINT32(base + 1, gObs.readingsCalls);

    // Different value: one notification carrying the earlier silent changes too.
    feed("RESPONSE:ACK\r\nCOMMAND:GET\r\nVOLUME\r\nVOLUME_SET:14\r\nID:flowradio\r\n", 700);
    TEST_ASSERT_EQUAL_UINT32(base + 2, gObs.readingsCalls);
    TEST_ASSERT_TRUE((gObs.lastMask & radioReadingBit(RadioReading::Volume)) != 0);
    TEST_ASSERT_TRUE((gObs.lastMask & radioReadingBit(RadioReading::Mute)) != 0);
}

void test_set_ack_with_volume_value()
{
    bringUpPoweredOn();
    feed("RESPONSE:ACK\r\nCOMMAND:SET\r\nVOLUME_SET:20\r\nID:flowradio\r\n", 300);
    TEST_ASSERT_EQUAL_STRING("20", reading(RadioReading::Volume));
}

void test_power_set_acks()
{
    bringUpPoweredOn();
    feed("RESPONSE:ACK\r\nCOMMAND:SET\r\nRADIO_OFF\r\nID:flowradio\r\n", 300);
    TEST_ASSERT_TRUE(gEngine->status() == RadioStatus::Off);
    feed("RESPONSE:ACK\r\nCOMMAND:SET\r\nRADIO_ON\r\nID:flowradio\r\n", 400);
    TEST_ASSERT_TRUE(gEngine->status() == RadioStatus::On);
    TEST_ASSERT_EQUAL_STRING("on", reading(RadioReading::Power));
}

void test_reply_with_foreign_identity_is_ignored()
{
    bringUpPoweredOn();
    TEST_ASSERT_EQUAL(RadioRxResult::ForeignId,
                      feed("RESPONSE:ACK\r\nCOMMAND:GET\r\nVOLUME\r\nVOLUME_SET:3\r\nID:someone\r\n", 300));
    TEST_ASSERT_EQUAL(RadioRxResult::ForeignId,
                      feed("RESPONSE:ACK\r\nCOMMAND:GET\r\nVOLUME\r\nVOLUME_SET:3\r\n", 300));
    TEST_ASSERT_NULL(reading(RadioReading::Volume));
}

void test_malformed_and_foreign_datagrams()
{
    bringUpPoweredOn();
    TEST_ASSERT_EQUAL(RadioRxResult::NotAck, feed("", 300));
    TEST_ASSERT_EQUAL(RadioRxResult::NotAck, feed("RESPONSE:NACK\r\nCOMMAND:GET\r\n", 300));
    TEST_ASSERT_EQUAL(RadioRxResult::NotAck, feed("RESPONSE:ACK\r\n", 300));
    TEST_ASSERT_EQUAL(RadioRxResult::UnknownVerb, feed("RESPONSE:ACK\r\nCOMMAND:REBOOT\r\nID:flowradio\r\n", 300));
    TEST_ASSERT_EQUAL(RadioRxResult::ForeignIp,
                      feed("RESPONSE:ACK\r\nCOMMAND:NOTIFICATION\r\nEVENT:POWER_OFF\r\nIP:10.0.0.9\r\n", 300));
    TEST_ASSERT_EQUAL(RadioRxResult::UnknownEvent,
                      feed("RESPONSE:ACK\r\nCOMMAND:NOTIFICATION\r\nEVENT:ALARM\r\nIP:10.0.0.5\r\n", 300));
    TEST_ASSERT_EQUAL(RadioRxResult::ForeignIp,
                      feed("RESPONSE:ACK\r\nCOMMAND:DISCOVER\r\nIP:10.0.0.9\r\nNAME:Other\r\n", 300));
    TEST_ASSERT_TRUE(gEngine->status() == RadioStatus::On);
    TEST_ASSERT_EQUAL_UINT8(0, gLink->sentCount);
}

void test_playing_mode_reply_builds_derived_readings()
{
    bringUpPoweredOn();
    feed("RESPONSE:ACK\r\nCOMMAND:GET\r\nPLAYING_MODE\r\nPLAYING:STATION\r\nID:flowradio\r\nID:4\r\n"
         "NAME:Jazz\r\nURL:http://jazz.example/live\r\n", 300);
    TEST_ASSERT_EQUAL_STRING("radio", reading(RadioReading::PlayMode));
    TEST_ASSERT_EQUAL_STRING("4", reading(RadioReading::PlayStation));
    TEST_ASSERT_EQUAL_STRING("station_4", reading(RadioReading::PlayModeX));
    TEST_ASSERT_EQUAL_STRING("Jazz|http://jazz.example/live", reading(RadioReading::PlayUrlX));
}

void test_unresolvable_host_blocks_traffic()
{
    char msg[Limits::Radio::MessageLen] = {0};
    TEST_ASSERT_EQUAL(RADIO_SVC_ERR_RESOLVE, startWithHost("nowhere.invalid", msg, sizeof(msg)));
    TEST_ASSERT_TRUE(gEngine->status() == RadioStatus::HostError);
    TEST_ASSERT_NOT_NULL(strstr(msg, "nowhere.invalid"));

    TEST_ASSERT_TRUE(gEngine->tick(0) == RadioPollAction::None);
    TEST_ASSERT_EQUAL(RadioRxResult::HostErrorDrop, feed(kDiscoverReply, 10));
    TEST_ASSERT_EQUAL(RADIO_SVC_ERR_HOST, gEngine->powerOff());
    TEST_ASSERT_EQUAL_UINT8(0, gLink->sentCount);

    // A valid host recovers and polls right away.
    TEST_ASSERT_EQUAL(RADIO_SVC_OK, gEngine->setHost("radio.local", 20, msg, sizeof(msg)));
    TEST_ASSERT_TRUE(gEngine->status() == RadioStatus::Offline);
    TEST_ASSERT_EQUAL_STRING("10.0.0.255", gEngine->broadcastAddress());
    TEST_ASSERT_TRUE(gEngine->tick(20) == RadioPollAction::Discover);
}

void test_without_address_operations_fail()
{
    TEST_ASSERT_EQUAL(RADIO_SVC_OK, startWithHost(""));
    TEST_ASSERT_EQUAL(RADIO_SVC_ERR_NO_ADDRESS, gEngine->powerOff());
    TEST_ASSERT_EQUAL(RADIO_SVC_ERR_NOT_READY, gEngine->powerOn());
    TEST_ASSERT_EQUAL_UINT8(0, gLink->sentCount);

    TEST_ASSERT_TRUE(gEngine->tick(0) == RadioPollAction::Discover);
    TEST_ASSERT_EQUAL_STRING(RadioDefaults::BroadcastAddress, gLink->last().target);
}

void test_broadcast_override_wins()
{
    TEST_ASSERT_EQUAL(RADIO_SVC_OK, startWithHost("10.0.0.5"));
    gEngine->setBroadcastAddress("10.0.255.255");
    TEST_ASSERT_EQUAL_STRING("10.0.255.255", gEngine->broadcastAddress());
    gEngine->setBroadcastAddress("");
    TEST_ASSERT_EQUAL_STRING("10.0.0.255", gEngine->broadcastAddress());
}

void test_volume_operations()
{
    bringUpPoweredOn();
    TEST_ASSERT_EQUAL(RADIO_SVC_ERR_INVALID_ARG, gEngine->setVolume(32));
    TEST_ASSERT_EQUAL(RADIO_SVC_ERR_INVALID_ARG, gEngine->setVolume(-1));
    TEST_ASSERT_EQUAL(RADIO_SVC_ERR_NOT_READY, gEngine->volumeStep(1));
    TEST_ASSERT_EQUAL_UINT8(0, gLink->sentCount);

    feed(kVolume12Reply, 300);
    TEST_ASSERT_EQUAL(RADIO_SVC_OK, gEngine->volumeStep(1));
    TEST_ASSERT_EQUAL_STRING("COMMAND:SET\r\nVOLUME_ABSOLUTE:13\r\nID:flowradio\r\n\r\n", gLink->last().payload);
    TEST_ASSERT_EQUAL(RADIO_SVC_OK, gEngine->setMute(true));
    TEST_ASSERT_EQUAL_STRING("COMMAND:SET\r\nVOLUME_MUTE\r\nID:flowradio\r\n\r\n", gLink->last().payload);
}

void test_play_operations()
{
    bringUpPoweredOn();
    TEST_ASSERT_EQUAL(RADIO_SVC_OK, gEngine->playStation(3));
    TEST_ASSERT_EQUAL_STRING("COMMAND:PLAY\r\nSTATION:3\r\nID:flowradio\r\n\r\n", gLink->last().payload);
    TEST_ASSERT_EQUAL(RADIO_SVC_ERR_INVALID_ARG, gEngine->playStation(9));
    TEST_ASSERT_EQUAL(RADIO_SVC_ERR_INVALID_ARG, gEngine->playMode("station_9"));

    TEST_ASSERT_EQUAL(RADIO_SVC_OK, gEngine->playMode("aux"));
    TEST_ASSERT_EQUAL_STRING("COMMAND:PLAY\r\nAUX\r\nID:flowradio\r\n\r\n", gLink->last().payload);

    TEST_ASSERT_EQUAL(RADIO_SVC_OK, gEngine->playUrl("Jazz|http://j/live"));
    TEST_ASSERT_EQUAL_STRING("COMMAND:PLAY\r\nTUNEIN_PLAY\r\nURL:http://j/live\r\nTEXT:Jazz\r\nID:flowradio\r\n\r\n",
                             gLink->last().payload);

    feed("RESPONSE:ACK\r\nCOMMAND:GET\r\nALL_STATION_INFO\r\nNAME:Jazz\r\nURL:u1\r\nNAME:Rock\r\nURL:u2\r\n"
         "ID:flowradio\r\n", 300);
    TEST_ASSERT_EQUAL_STRING("Rock", reading(RadioReading::Station2Name));
    TEST_ASSERT_EQUAL(RADIO_SVC_OK, gEngine->playStationName("Rock"));
    TEST_ASSERT_EQUAL_STRING("COMMAND:PLAY\r\nSTATION:2\r\nID:flowradio\r\n\r\n", gLink->last().payload);
    TEST_ASSERT_EQUAL(RADIO_SVC_ERR_INVALID_ARG, gEngine->playStationName("Metal"));
}

void test_silent_peer_goes_offline()
{
    bringUpPoweredOn();
    TEST_ASSERT_TRUE(gEngine->tick(60000) == RadioPollAction::StatusRefresh);
    TEST_ASSERT_TRUE(gEngine->status() == RadioStatus::On);

    gEngine->tick(120000);
    TEST_ASSERT_TRUE(gEngine->status() == RadioStatus::Offline);
    TEST_ASSERT_EQUAL_STRING("off", reading(RadioReading::Power));
    TEST_ASSERT_TRUE(gEngine->tick(180000) == RadioPollAction::Discover);
}

void test_listen_port_change_restarts_listener()
{
    TEST_ASSERT_EQUAL(RADIO_SVC_OK, startWithHost("10.0.0.5"));
    TEST_ASSERT_TRUE(gEngine->setListenPort(5000));
    TEST_ASSERT_EQUAL_UINT16(5000, gLink->listenPort);
    TEST_ASSERT_EQUAL_UINT8(2, gLink->listenerStarts);

    gEngine->end();
    TEST_ASSERT_FALSE(gLink->listening());
    TEST_ASSERT_TRUE(gEngine->tick(1000000) == RadioPollAction::None);
}

void test_shorter_timer_pulls_wakeup_forward()
{
    TEST_ASSERT_EQUAL(RADIO_SVC_OK, startWithHost("10.0.0.5"));
    gEngine->tick(0);
    TEST_ASSERT_EQUAL_UINT32(60000, gEngine->scheduler().nextWakeMs());
    gEngine->setTimerSec(5, 1000);
    TEST_ASSERT_EQUAL_UINT32(6000, gEngine->scheduler().nextWakeMs());
}

void test_system_booted_requests_status()
{
    bringUpPoweredOn();
    TEST_ASSERT_EQUAL(RadioRxResult::Applied,
                      feed("RESPONSE:ACK\r\nCOMMAND:NOTIFICATION\r\nEVENT:SYSTEM_BOOTED\r\nIP:10.0.0.5\r\n", 300));
    TEST_ASSERT_EQUAL_UINT8(RADIO_STATUS_BLOCK_COUNT, gLink->sentCount);
    TEST_ASSERT_EQUAL_STRING("COMMAND:GET\r\nPOWER_STATUS\r\nID:flowradio\r\n\r\n", gLink->sent[0].payload);
    TEST_ASSERT_EQUAL_STRING("COMMAND:GET\r\nPLAYING_MODE\r\nID:flowradio\r\n\r\n", gLink->sent[1].payload);
    TEST_ASSERT_EQUAL_STRING(kGetVolumeFrame, gLink->sent[2].payload);
}

void test_station_events_query_playing_mode()
{
    static const char kGetPlayingMode[] = "COMMAND:GET\r\nPLAYING_MODE\r\nID:flowradio\r\n\r\n";
    bringUpPoweredOn();

    feed("RESPONSE:ACK\r\nCOMMAND:NOTIFICATION\r\nEVENT:STATION_CHANGED\r\nIP:10.0.0.5\r\n", 300);
    TEST_ASSERT_EQUAL_UINT8(1, gLink->sentCount);
    TEST_ASSERT_EQUAL_STRING(kGetPlayingMode, gLink->sent[0].payload);

    gLink->clearSent();
    feed("RESPONSE:ACK\r\nCOMMAND:NOTIFICATION\r\nEVENT:URL_IS_PLAYING\r\nIP:10.0.0.5\r\n", 400);
    TEST_ASSERT_EQUAL_UINT8(1, gLink->sentCount);
    TEST_ASSERT_EQUAL_STRING(kGetPlayingMode, gLink->sent[0].payload);
    TEST_ASSERT_TRUE(gEngine->status() == RadioStatus::On);
}

void test_clearing_host_forgets_address()
{
    bringUpPoweredOn();
    TEST_ASSERT_EQUAL(RADIO_SVC_OK, gEngine->setHost("", 300, nullptr, 0));
    TEST_ASSERT_TRUE(gEngine->status() == RadioStatus::Offline);
    TEST_ASSERT_EQUAL_STRING("", reading(RadioReading::IpAddress));
    TEST_ASSERT_EQUAL_STRING(RadioDefaults::BroadcastAddress, gEngine->broadcastAddress());

    // Notifications need a known address again.
    TEST_ASSERT_EQUAL(RadioRxResult::ForeignIp,
                      feed("RESPONSE:ACK\r\nCOMMAND:NOTIFICATION\r\nEVENT:POWER_OFF\r\nIP:10.0.0.5\r\n", 400));
    TEST_ASSERT_TRUE(gEngine->tick(300) == RadioPollAction::Discover);
}

void test_discovery_follows_renamed_address()
{
    TEST_ASSERT_EQUAL(RADIO_SVC_OK, startWithHost(""));
    gEngine->tick(0);
    TEST_ASSERT_EQUAL(RadioRxResult::Applied, feed(kDiscoverReply, 100));
    TEST_ASSERT_EQUAL_STRING("10.0.0.5", reading(RadioReading::IpAddress));
    TEST_ASSERT_EQUAL_STRING("10.0.0.255", gEngine->broadcastAddress());
    gLink->clearSent();

    // Same name on a new lease is still our device; no second full refresh.
    TEST_ASSERT_EQUAL(RadioRxResult::Applied,
                      feed("RESPONSE:ACK\r\nCOMMAND:DISCOVER\r\nIP:10.0.1.7\r\nNAME:Radio1\r\n", 200));
    TEST_ASSERT_EQUAL_STRING("10.0.1.7", reading(RadioReading::IpAddress));
    TEST_ASSERT_EQUAL_STRING("10.0.1.255", gEngine->broadcastAddress());
    TEST_ASSERT_EQUAL_UINT8(0, gLink->sentCount);

    TEST_ASSERT_EQUAL(RadioRxResult::ForeignIp,
                      feed("RESPONSE:ACK\r\nCOMMAND:DISCOVER\r\nIP:10.0.1.9\r\nNAME:Kitchen\r\n", 300));
    TEST_ASSERT_EQUAL(RadioRxResult::Applied,
                      feed("RESPONSE:ACK\r\nCOMMAND:NOTIFICATION\r\nEVENT:VOLUME_CHANGED\r\nIP:10.0.1.7\r\n", 400));
    TEST_ASSERT_EQUAL_STRING("10.0.1.7", gLink->last().target);
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_discovery_end_to_end);
    RUN_TEST(test_poll_after_acquisition_is_status_refresh);
    RUN_TEST(test_volume_changed_notification_sends_single_get_volume);
    RUN_TEST(test_power_notifications_drive_status);
    RUN_TEST(test_mute_then_unmute_reconciles_volume);
    RUN_TEST(test_set_ack_with_volume_value);
    RUN_TEST(test_power_set_acks);
    RUN_TEST(test_reply_with_foreign_identity_is_ignored);
    RUN_TEST(test_malformed_and_foreign_datagrams);
    RUN_TEST(test_playing_mode_reply_builds_derived_readings);
    RUN_TEST(test_unresolvable_host_blocks_traffic);
    RUN_TEST(test_without_address_operations_fail);
    RUN_TEST(test_broadcast_override_wins);
    RUN_TEST(test_volume_operations);
    RUN_TEST(test_play_operations);
    RUN_TEST(test_silent_peer_goes_offline);
    RUN_TEST(test_listen_port_change_restarts_listener);
    RUN_TEST(test_shorter_timer_pulls_wakeup_forward);
    RUN_TEST(test_system_booted_requests_status);
    RUN_TEST(test_station_events_query_playing_mode);
    RUN_TEST(test_clearing_host_forgets_address);
    RUN_TEST(test_discovery_follows_renamed_address);
    return UNITY_END();
}
