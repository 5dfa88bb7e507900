#include "FakeTransport.hpp"
#include "device/DeviceSession.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <thread>

using namespace dps150;
using namespace std::chrono_literals;

namespace {
Session::Config quickConfig(const bool readerThread = false) {
    Session::Config config;
    config.settleDelay = 0ms;
    config.pollInterval = 2ms;
    config.readTimeout = 5ms;
    config.writeRetryDelay = 1ms;
    config.readerThread = readerThread;
    return config;
}
std::vector<uint8_t> inbound(const uint8_t field, const std::vector<uint8_t>& payload) {
    return encode(Header::INPUT, Command::GET, field, payload);
}
std::vector<uint8_t> inboundFloat(const uint8_t field, const float value) {
    return encodeFloat(Header::INPUT, Command::GET, field, value);
}
}    // namespace

// -----------------------------------------------------------------------------------------------

TEST(DeviceSession, ConnectSendsInitializationSequence) {
    FakeTransport transport;
    Session session(quickConfig(), transport);
    session.connect();
    EXPECT_EQ(session.state(), Session::State::Streaming);
    EXPECT_TRUE(transport.isOpen());
    const std::vector<std::vector<uint8_t>> expected = {
        { 0xF1, 0xC1, 0x00, 0x01, 0x01, 0x02 },
        { 0xF1, 0xB0, 0x00, 0x01, 0x05, 0x06 },
        { 0xF1, 0xA1, 0xDE, 0x01, 0x00, 0xDF },
        { 0xF1, 0xA1, 0xDF, 0x01, 0x00, 0xE0 },
        { 0xF1, 0xA1, 0xE0, 0x01, 0x00, 0xE1 },
        { 0xF1, 0xA1, 0xFF, 0x01, 0x00, 0x00 },
    };
    EXPECT_EQ(transport.frames(), expected);
}

TEST(DeviceSession, BaudSelectorFollowsTransport) {
    FakeTransport transport(9600);
    Session session(quickConfig(), transport);
    session.connect();
    ASSERT_GE(transport.frames().size(), 2u);
    EXPECT_EQ(transport.frames()[1], (std::vector<uint8_t>{ 0xF1, 0xB0, 0x00, 0x01, 0x01, 0x02 }));
}

TEST(DeviceSession, ConnectTwiceIsHarmless) {
    FakeTransport transport;
    Session session(quickConfig(), transport);
    session.connect();
    session.connect();
    EXPECT_EQ(transport.opens(), 1);
    EXPECT_EQ(transport.frames().size(), 6u);
}

TEST(DeviceSession, UnsupportedBaudRateRejectedBeforeOpen) {
    FakeTransport transport(4800);
    Session session(quickConfig(), transport);
    EXPECT_THROW(session.connect(), ValidationError);
    EXPECT_EQ(transport.opens(), 0);
    EXPECT_EQ(session.state(), Session::State::Disconnected);
}

TEST(DeviceSession, OpenFailureRollsBack) {
    FakeTransport transport;
    transport.failOpen = true;
    Session session(quickConfig(true), transport);
    EXPECT_THROW(session.connect(), ConnectError);
    EXPECT_EQ(session.state(), Session::State::Disconnected);
    EXPECT_TRUE(transport.frames().empty());
}

TEST(DeviceSession, InitializationWriteFailureRollsBack) {
    FakeTransport transport;
    transport.failWriteAfter = 2;
    Session session(quickConfig(true), transport);
    EXPECT_THROW(session.connect(), ConnectError);
    EXPECT_EQ(session.state(), Session::State::Disconnected);
    EXPECT_FALSE(transport.isOpen());
    EXPECT_EQ(transport.closes(), 1);
    transport.failWriteAfter = -1;
    session.connect();
    EXPECT_EQ(session.state(), Session::State::Streaming);
}

// -----------------------------------------------------------------------------------------------

TEST(DeviceSession, SetVoltageEncodesFloat) {
    FakeTransport transport;
    Session session(quickConfig(), transport);
    session.connect();
    transport.clearWritten();
    session.setFloatValue(Field::VOLTAGE_SET, 5.0f);
    session.setVoltage(5.0f);
    const std::vector<uint8_t> expected = { 0xF1, 0xB1, 193, 4, 0x00, 0x00, 0xA0, 0x40, 0xA5 };
    EXPECT_EQ(transport.frames(), (std::vector<std::vector<uint8_t>>{ expected, expected }));
}

TEST(DeviceSession, ByteCommands) {
    FakeTransport transport;
    Session session(quickConfig(), transport);
    session.connect();
    transport.clearWritten();
    session.enable();
    session.disable();
    session.startMetering();
    session.stopMetering();
    session.setBrightness(10);
    session.setVolume(0);
    const std::vector<std::vector<uint8_t>> expected = {
        { 0xF1, 0xB1, 219, 0x01, 0x01, static_cast<uint8_t>(219 + 1 + 1) },
        { 0xF1, 0xB1, 219, 0x01, 0x00, static_cast<uint8_t>(219 + 1) },
        { 0xF1, 0xB1, 216, 0x01, 0x01, static_cast<uint8_t>(216 + 1 + 1) },
        { 0xF1, 0xB1, 216, 0x01, 0x00, static_cast<uint8_t>(216 + 1) },
        { 0xF1, 0xB1, 214, 0x01, 0x0A, static_cast<uint8_t>(214 + 1 + 10) },
        { 0xF1, 0xB1, 215, 0x01, 0x00, static_cast<uint8_t>(215 + 1) },
    };
    EXPECT_EQ(transport.frames(), expected);
}

TEST(DeviceSession, ByteValueOutOfRangeRejectedWithoutIo) {
    FakeTransport transport;
    Session session(quickConfig(), transport);
    session.connect();
    transport.clearWritten();
    EXPECT_THROW(session.setBrightness(256), ValidationError);
    EXPECT_THROW(session.setVolume(-1), ValidationError);
    EXPECT_TRUE(transport.frames().empty());
}

TEST(DeviceSession, ProtectionThresholdsUseTheirFields) {
    FakeTransport transport;
    Session session(quickConfig(), transport);
    session.connect();
    transport.clearWritten();
    session.setProtection(Protection::OVP, 30.0f);
    session.setProtection(Protection::OCP, 5.1f);
    session.setProtection(Protection::OPP, 150.0f);
    session.setProtection(Protection::OTP, 80.0f);
    session.setProtection(Protection::LVP, 4.5f);
    const auto frames = transport.frames();
    ASSERT_EQ(frames.size(), 5u);
    EXPECT_EQ(frames[0], encodeFloat(Header::OUTPUT, Command::SET, 209, 30.0f));
    EXPECT_EQ(frames[1], encodeFloat(Header::OUTPUT, Command::SET, 210, 5.1f));
    EXPECT_EQ(frames[2], encodeFloat(Header::OUTPUT, Command::SET, 211, 150.0f));
    EXPECT_EQ(frames[3], encodeFloat(Header::OUTPUT, Command::SET, 212, 80.0f));
    EXPECT_EQ(frames[4], encodeFloat(Header::OUTPUT, Command::SET, 213, 4.5f));
}

TEST(DeviceSession, GroupPresetsUseTheirFields) {
    FakeTransport transport;
    Session session(quickConfig(), transport);
    session.connect();
    transport.clearWritten();
    session.setGroup(3, 12.0f, 1.0f);
    session.setGroup(1, std::nullopt, 0.5f);
    session.setGroup(6, 24.0f);
    const auto frames = transport.frames();
    ASSERT_EQ(frames.size(), 4u);
    EXPECT_EQ(frames[0], encodeFloat(Header::OUTPUT, Command::SET, 201, 12.0f));
    EXPECT_EQ(frames[1], encodeFloat(Header::OUTPUT, Command::SET, 202, 1.0f));
    EXPECT_EQ(frames[2], encodeFloat(Header::OUTPUT, Command::SET, 198, 0.5f));
    EXPECT_EQ(frames[3], encodeFloat(Header::OUTPUT, Command::SET, 207, 24.0f));
}

TEST(DeviceSession, GroupOutOfRangeRejectedWithoutIo) {
    FakeTransport transport;
    Session session(quickConfig(), transport);
    session.connect();
    transport.clearWritten();
    EXPECT_THROW(session.setGroup(0, 5.0f), ValidationError);
    EXPECT_THROW(session.setGroup(7, 5.0f, 1.0f), ValidationError);
    EXPECT_TRUE(transport.frames().empty());
}

TEST(DeviceSession, GetAllRequestsBulkField) {
    FakeTransport transport;
    Session session(quickConfig(), transport);
    session.connect();
    transport.clearWritten();
    session.getAll();
    EXPECT_EQ(transport.frames(), (std::vector<std::vector<uint8_t>>{ { 0xF1, 0xA1, 0xFF, 0x01, 0x00, 0x00 } }));
}

TEST(DeviceSession, CommandWhileDisconnectedThrows) {
    FakeTransport transport;
    Session session(quickConfig(), transport);
    EXPECT_THROW(session.setVoltage(5.0f), TransportError);
    EXPECT_THROW(session.getAll(), TransportError);
    EXPECT_TRUE(transport.frames().empty());
}

TEST(DeviceSession, WriteFailurePropagatesAndKeepsState) {
    FakeTransport transport;
    Session session(quickConfig(), transport);
    session.connect();
    transport.failWriteAfter = static_cast<int>(transport.frames().size());
    EXPECT_THROW(session.setCurrent(1.0f), TransportError);
    EXPECT_EQ(session.state(), Session::State::Streaming);
}

// -----------------------------------------------------------------------------------------------

TEST(DeviceSession, DisconnectSendsStopAndIsIdempotent) {
    FakeTransport transport;
    Session session(quickConfig(), transport);
    session.connect();
    transport.clearWritten();
    session.disconnect();
    EXPECT_EQ(session.state(), Session::State::Disconnected);
    EXPECT_EQ(transport.frames(), (std::vector<std::vector<uint8_t>>{ { 0xF1, 0xC1, 0x00, 0x01, 0x00, 0x01 } }));
    EXPECT_EQ(transport.closes(), 1);
    session.disconnect();
    EXPECT_EQ(transport.frames().size(), 1u);
    EXPECT_EQ(transport.closes(), 1);
}

TEST(DeviceSession, DisconnectWhenNeverConnectedDoesNothing) {
    FakeTransport transport;
    Session session(quickConfig(), transport);
    session.disconnect();
    EXPECT_TRUE(transport.frames().empty());
    EXPECT_EQ(transport.closes(), 0);
}

TEST(DeviceSession, DisconnectCompletesWhenStopToggleFails) {
    FakeTransport transport;
    Session session(quickConfig(), transport);
    session.connect();
    transport.failWriteAfter = 0;
    session.disconnect();
    EXPECT_EQ(session.state(), Session::State::Disconnected);
    EXPECT_FALSE(transport.isOpen());
}

TEST(DeviceSession, DestructorDisconnects) {
    FakeTransport transport;
    {
        Session session(quickConfig(true), transport);
        session.connect();
    }
    EXPECT_FALSE(transport.isOpen());
    EXPECT_EQ(transport.frames().back(), (std::vector<uint8_t>{ 0xF1, 0xC1, 0x00, 0x01, 0x00, 0x01 }));
}

// -----------------------------------------------------------------------------------------------

TEST(DeviceSession, PollDecodesIntoSnapshotAndHandler) {
    FakeTransport transport;
    std::vector<Update> updates;
    Session session(quickConfig(), transport, [&updates](const Update& update) {
        updates.push_back(update);
    });
    session.connect();
    transport.inject(inboundFloat(Field::TEMPERATURE, 28.5f));
    transport.inject(inbound(Field::BRIGHTNESS, { 7 }));
    while (transport.pending())
        session.poll();
    ASSERT_EQ(updates.size(), 2u);
    ASSERT_EQ(updates[0].size(), 1u);
    EXPECT_EQ(updates[0][0].first, Key::Temperature);
    EXPECT_EQ(updates[1][0].first, Key::Brightness);

    transport.inject(inboundFloat(Field::TEMPERATURE, 29.0f));
    session.poll();
    ASSERT_EQ(updates.size(), 3u);
    ASSERT_EQ(updates[2].size(), 1u);
    EXPECT_EQ(updates[2][0].first, Key::Temperature);

    const DeviceSnapshot snapshot = session.snapshot();
    EXPECT_EQ(snapshot.get<float>(Key::Temperature), std::optional<float>(29.0f));
    EXPECT_EQ(snapshot.get<uint8_t>(Key::Brightness), std::optional<uint8_t>(7));
}

TEST(DeviceSession, PollReassemblesSplitFrames) {
    FakeTransport transport;
    Session session(quickConfig(), transport);
    session.connect();
    const auto frame = inbound(Field::MODEL_NAME, { 'D', 'P', 'S', '-', '1', '5', '0' });
    transport.inject(std::vector<uint8_t>(frame.begin(), frame.begin() + 6));
    session.poll();
    EXPECT_FALSE(session.snapshot().has(Key::ModelName));
    transport.inject(std::vector<uint8_t>(frame.begin() + 6, frame.end()));
    session.poll();
    EXPECT_EQ(session.snapshot().get<std::string>(Key::ModelName), std::optional<std::string>("DPS-150"));
}

TEST(DeviceSession, PollWhenDisconnectedReadsNothing) {
    FakeTransport transport;
    Session session(quickConfig(), transport);
    transport.inject(inbound(Field::BRIGHTNESS, { 7 }));
    EXPECT_EQ(session.poll(), 0u);
    EXPECT_TRUE(transport.pending());
}

TEST(DeviceSession, PollReadFailurePropagates) {
    FakeTransport transport;
    Session session(quickConfig(), transport);
    session.connect();
    transport.failRead = true;
    EXPECT_THROW(session.poll(), TransportError);
    EXPECT_EQ(session.state(), Session::State::Streaming);
}

TEST(DeviceSession, ReconnectClearsSnapshot) {
    FakeTransport transport;
    Session session(quickConfig(), transport);
    session.connect();
    transport.inject(inbound(Field::VOLUME, { 2 }));
    session.poll();
    EXPECT_TRUE(session.snapshot().has(Key::Volume));
    session.disconnect();
    session.connect();
    EXPECT_TRUE(session.snapshot().empty());
    EXPECT_EQ(transport.opens(), 2);
}

TEST(DeviceSession, UpdateQueueReceivesInDecodeOrder) {
    FakeTransport transport;
    UpdateQueue queue(8);
    Session session(quickConfig(), transport, queue.handler());
    session.connect();
    std::vector<uint8_t> chunk = inbound(Field::VOLUME, { 1 });
    const auto second = inbound(Field::MODE, { 0 });
    chunk.insert(chunk.end(), second.begin(), second.end());
    transport.inject(chunk);
    session.poll();
    Update update;
    ASSERT_TRUE(queue.pull(update));
    EXPECT_EQ(update.at(0).first, Key::Volume);
    ASSERT_TRUE(queue.pull(update));
    EXPECT_EQ(update.at(0).first, Key::Mode);
    EXPECT_FALSE(queue.pull(update));
}

// -----------------------------------------------------------------------------------------------

TEST(DeviceSession, ReaderThreadDeliversAndStopsPromptly) {
    FakeTransport transport;
    Session session(quickConfig(true), transport);
    session.connect();
    transport.inject(inboundFloat(Field::INPUT_VOLTAGE, 12.0f));
    ASSERT_TRUE(waitFor([&session]() {
        return session.snapshot().has(Key::InputVoltage);
    }));
    EXPECT_EQ(session.snapshot().get<float>(Key::InputVoltage), std::optional<float>(12.0f));

    const auto started = std::chrono::steady_clock::now();
    session.disconnect();
    EXPECT_LT(std::chrono::steady_clock::now() - started, 500ms);
    EXPECT_EQ(session.state(), Session::State::Disconnected);
}

TEST(DeviceSession, ReaderThreadSurvivesReadFailures) {
    FakeTransport transport;
    Session session(quickConfig(true), transport);
    session.connect();
    transport.failRead = true;
    std::this_thread::sleep_for(20ms);
    transport.failRead = false;
    transport.inject(inbound(Field::VOLUME, { 4 }));
    EXPECT_TRUE(waitFor([&session]() {
        return session.snapshot().has(Key::Volume);
    }));
}

TEST(DeviceSession, SettleDelayFollowsEveryWrite) {
    FakeTransport transport;
    Session::Config config = quickConfig();
    config.settleDelay = 20ms;
    Session session(config, transport);
    session.connect();
    const auto written = transport.written();
    ASSERT_EQ(written.size(), 6u);
    for (size_t i = 1; i < written.size(); i++)
        EXPECT_GE(written[i].at - written[i - 1].at, 20ms) << "write " << i;
}

// -----------------------------------------------------------------------------------------------

TEST(DeviceSession, DiagnosticsReportCounters) {
    FakeTransport transport;
    Session session(quickConfig(), transport);
    session.connect();
    auto bad = inbound(Field::VOLUME, { 1 });
    bad.back() ^= 0xFF;
    transport.inject(bad);
    transport.inject(inbound(Field::PROTECTION_STATE, { 9 }));
    transport.inject(inbound(Field::VOLUME, { 1 }));
    while (transport.pending())
        session.poll();

    JsonDocument doc;
    ASSERT_FALSE(deserializeJson(doc, collectDiagnostics(Diagnosticable::List{ &session })));
    const JsonObjectConst sub = doc["session"].as<JsonObjectConst>();
    EXPECT_STREQ(sub["state"].as<const char*>(), "streaming");
    EXPECT_EQ(sub["writes"].as<unsigned long>(), 6ul);
    EXPECT_EQ(sub["frames"].as<unsigned long>(), 2ul);
    EXPECT_EQ(sub["checksumErrors"].as<unsigned long>(), 1ul);
    EXPECT_EQ(sub["decodeErrors"].as<unsigned long>(), 1ul);
    EXPECT_EQ(sub["keys"].as<unsigned long>(), 1ul);
}

// -----------------------------------------------------------------------------------------------

TEST(DeviceSession, WriteRetriesBeforeFailing) {
    FakeTransport transport;
    Session::Config config = quickConfig();
    config.writeRetries = 3;
    Session session(config, transport);
    session.connect();
    transport.clearWritten();
    transport.failNextWrites = 3;
    session.setVoltage(5.0f);
    EXPECT_EQ(transport.frames(), (std::vector<std::vector<uint8_t>>{ encodeFloat(Header::OUTPUT, Command::SET, Field::VOLTAGE_SET, 5.0f) }));

    transport.failNextWrites = 4;
    EXPECT_THROW(session.setCurrent(1.0f), TransportError);
    EXPECT_EQ(transport.failNextWrites.load(), 0);
    EXPECT_EQ(transport.frames().size(), 1u);

    JsonDocument doc;
    ASSERT_FALSE(deserializeJson(doc, collectDiagnostics(Diagnosticable::List{ &session })));
    EXPECT_EQ(doc["session"]["writeRetries"].as<unsigned long>(), 6ul);
    EXPECT_EQ(doc["session"]["writeFailures"].as<unsigned long>(), 1ul);
}

TEST(DeviceSession, WriteRetriesSpacedByRetryDelay) {
    FakeTransport transport;
    Session::Config config = quickConfig();
    config.writeRetryDelay = 15ms;
    Session session(config, transport);
    session.connect();
    transport.failNextWrites = 2;
    const auto started = std::chrono::steady_clock::now();
    session.getAll();
    EXPECT_GE(std::chrono::steady_clock::now() - started, 30ms);
}

TEST(DeviceSession, ConnectDiscardsStaleInput) {
    FakeTransport transport;
    std::vector<Update> updates;
    Session session(quickConfig(), transport, [&updates](const Update& update) {
        updates.push_back(update);
    });
    transport.inject(inbound(Field::BRIGHTNESS, { 3 }));
    transport.inject({ 0xF0, 0xA1, Field::VOLUME });
    session.connect();
    EXPECT_FALSE(transport.pending());

    transport.inject(inbound(Field::MODE, { 1 }));
    session.poll();
    ASSERT_EQ(updates.size(), 1u);
    EXPECT_EQ(updates[0].at(0).first, Key::Mode);
    EXPECT_FALSE(session.snapshot().has(Key::Brightness));

    JsonDocument doc;
    ASSERT_FALSE(deserializeJson(doc, collectDiagnostics(Diagnosticable::List{ &session })));
    EXPECT_EQ(doc["session"]["bytesFlushed"].as<unsigned long>(), 9ul);
    EXPECT_EQ(doc["session"]["bytesDiscarded"].as<unsigned long>(), 0ul);
}

// -----------------------------------------------------------------------------------------------

TEST(DeviceSession, HandlerFailureKeepsFollowingFrames) {
    FakeTransport transport;
    std::vector<Key> delivered;
    Session session(quickConfig(), transport, [&delivered](const Update& update) {
        if (update.at(0).first == Key::Volume)
            throw std::runtime_error("display unavailable");
        delivered.push_back(update.at(0).first);
    });
    session.connect();
    std::vector<uint8_t> chunk = inbound(Field::VOLUME, { 2 });
    const auto second = inbound(Field::MODE, { 0 });
    chunk.insert(chunk.end(), second.begin(), second.end());
    transport.inject(chunk);
    session.poll();

    const DeviceSnapshot snapshot = session.snapshot();
    EXPECT_EQ(snapshot.get<uint8_t>(Key::Volume), std::optional<uint8_t>(2));
    EXPECT_EQ(snapshot.get<Mode>(Key::Mode), std::optional<Mode>(Mode::ConstantCurrent));
    EXPECT_EQ(delivered, (std::vector<Key>{ Key::Mode }));

    JsonDocument doc;
    ASSERT_FALSE(deserializeJson(doc, collectDiagnostics(Diagnosticable::List{ &session })));
    EXPECT_EQ(doc["session"]["handlerErrors"].as<unsigned long>(), 1ul);
    EXPECT_EQ(doc["session"]["frames"].as<unsigned long>(), 2ul);
}

TEST(DeviceSession, HandlerMayDisconnectFromReaderThread) {
    FakeTransport transport;
    Session* self = nullptr;
    Session session(quickConfig(true), transport, [&self](const Update& update) {
        if (update.at(0).first == Key::ProtectionState)
            self->disconnect();
    });
    self = &session;
    session.connect();
    transport.inject(inbound(Field::PROTECTION_STATE, { 1 }));
    ASSERT_TRUE(waitFor([&session]() {
        return session.state() == Session::State::Disconnected;
    }));
    EXPECT_FALSE(transport.isOpen());
    EXPECT_EQ(transport.frames().back(), (std::vector<uint8_t>{ 0xF1, 0xC1, 0x00, 0x01, 0x00, 0x01 }));

    session.connect();
    EXPECT_EQ(session.state(), Session::State::Streaming);
    transport.inject(inbound(Field::VOLUME, { 5 }));
    EXPECT_TRUE(waitFor([&session]() {
        return session.snapshot().has(Key::Volume);
    }));
}

// -----------------------------------------------------------------------------------------------

TEST(DeviceSession, ConcurrentCommandsAreSerialized) {
    constexpr int THREADS = 3, COMMANDS = 5;
    constexpr auto SETTLE = 5ms;
    FakeTransport transport;
    Session::Config config = quickConfig();
    config.settleDelay = SETTLE;
    Session session(config, transport);
    session.connect();
    transport.clearWritten();

    std::vector<std::thread> threads;
    for (int t = 0; t < THREADS; t++)
        threads.emplace_back([&session, t]() {
            for (int i = 0; i < COMMANDS; i++)
                session.setVoltage(static_cast<float>(t * 10 + i));
        });
    for (auto& thread : threads)
        thread.join();

    const auto written = transport.written();
    ASSERT_EQ(written.size(), static_cast<size_t>(THREADS * COMMANDS));
    for (size_t i = 0; i < written.size(); i++) {
        EXPECT_EQ(written[i].bytes.size(), Constants::SIZE_FRAME_MIN + Constants::SIZE_FLOAT) << "write " << i;
        EXPECT_EQ(written[i].bytes.back(), checksum(Field::VOLTAGE_SET, std::vector<uint8_t>(written[i].bytes.begin() + 4, written[i].bytes.end() - 1)));
        if (i > 0)
            EXPECT_GE(written[i].at - written[i - 1].at, SETTLE) << "write " << i;
    }
}
