/**
 * WebSocket wire format: JSON control messages and raw PCM frames.
 * Asserts:
 * - Each control message serializes to a one-key object and parses back.
 * - {"end":true} is EndMsg from the client and EndOfTurnMsg from the server.
 * - Malformed, multi-key, wrong-direction and wrong-type messages are parse errors.
 * - PCM frames split at the nominal size; s16le conversion.
 *
 * Run from build dir: ./test_wire_protocol
 */

#include "audio_frame_codec.h"
#include "control_channel.h"
#include <nlohmann/json.hpp>
#include <iostream>
#include <string>

using namespace voxlink;
using json = nlohmann::json;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static bool parses(const std::string& text, Direction direction) {
    return ControlChannel::parse(text, direction).is_ok();
}

int main() {
    // --- Serialization ---
    {
        ASSERT(json::parse(ControlChannel::serialize(StartMsg{})) == json({{"start", true}}));
        ASSERT(json::parse(ControlChannel::serialize(EndMsg{})) == json({{"end", true}}));
        ASSERT(json::parse(ControlChannel::serialize(EndOfTurnMsg{})) == json({{"end", true}}));

        std::string ut = ControlChannel::serialize(UserTranscriptionMsg{"открой ютуб"});
        ASSERT(json::parse(ut) == json({{"user_transcription", "открой ютуб"}}));
        ASSERT(ut.find("открой") != std::string::npos);  // not \u-escaped

        std::string at = ControlChannel::serialize(AssistantTextMsg{"Say \"hi\"\n"});
        ASSERT(json::parse(at)["assistant_text"] == "Say \"hi\"\n");

        // Invalid UTF-8 from the model still yields valid JSON
        std::string bad = ControlChannel::serialize(AssistantTextMsg{std::string("ok \xC3", 4)});
        ASSERT(json::accept(bad));
    }

    // --- Client -> server ---
    {
        auto start = ControlChannel::parse("{\"start\":true}", Direction::ClientToServer);
        ASSERT(start.is_ok() && std::holds_alternative<StartMsg>(start.value()));
        auto end = ControlChannel::parse(" { \"end\" : true } ", Direction::ClientToServer);
        ASSERT(end.is_ok() && std::holds_alternative<EndMsg>(end.value()));
        if (end.is_ok()) {
            ASSERT(std::string(ControlChannel::kind_name(end.value())) == "end");
        }

        ASSERT(!parses("{\"start\":false}", Direction::ClientToServer));
        ASSERT(!parses("{\"start\":1}", Direction::ClientToServer));
        ASSERT(!parses("{\"start\":true,\"end\":true}", Direction::ClientToServer));
        ASSERT(!parses("{}", Direction::ClientToServer));
        ASSERT(!parses("[\"start\"]", Direction::ClientToServer));
        ASSERT(!parses("{\"stop\":true}", Direction::ClientToServer));
        ASSERT(!parses("{\"user_transcription\":\"x\"}", Direction::ClientToServer));
        ASSERT(!parses("{\"assistant_text\":\"x\"}", Direction::ClientToServer));
        ASSERT(!parses("{\"start\":true", Direction::ClientToServer));
        ASSERT(!parses("", Direction::ClientToServer));

        auto err = ControlChannel::parse("not json", Direction::ClientToServer);
        ASSERT(err.is_error());
        if (err.is_error()) {
            ASSERT(err.error().type == ErrorType::ParseError);
        }
    }

    // --- Server -> client ---
    {
        auto eot = ControlChannel::parse("{\"end\":true}", Direction::ServerToClient);
        ASSERT(eot.is_ok() && std::holds_alternative<EndOfTurnMsg>(eot.value()));

        auto ut = ControlChannel::parse("{\"user_transcription\":\"привет\"}", Direction::ServerToClient);
        ASSERT(ut.is_ok());
        if (ut.is_ok()) {
            const auto* msg = std::get_if<UserTranscriptionMsg>(&ut.value());
            ASSERT(msg && msg->text == "привет");
        }

        auto at = ControlChannel::parse(ControlChannel::serialize(AssistantTextMsg{"Готово."}),
                                        Direction::ServerToClient);
        ASSERT(at.is_ok());
        if (at.is_ok()) {
            const auto* msg = std::get_if<AssistantTextMsg>(&at.value());
            ASSERT(msg && msg->text == "Готово.");
        }

        ASSERT(!parses("{\"start\":true}", Direction::ServerToClient));
        ASSERT(!parses("{\"assistant_text\":42}", Direction::ServerToClient));
        ASSERT(!parses("{\"user_transcription\":null}", Direction::ServerToClient));
    }

    // --- PCM framing ---
    {
        AudioFrameCodec codec(1024);
        ASSERT(codec.frame_bytes() == 1024);
        ASSERT(codec.split("").empty());

        std::string pcm(2500, '\x7f');
        auto frames = codec.split(pcm);
        ASSERT(frames.size() == 3);
        if (frames.size() == 3) {
            ASSERT(frames[0].size() == 1024 && frames[1].size() == 1024 && frames[2].size() == 452);
            ASSERT(frames[0] + frames[1] + frames[2] == pcm);
        }

        AudioFrameCodec fallback(0);
        ASSERT(fallback.frame_bytes() == static_cast<size_t>(DEFAULT_FRAME_BYTES));
    }

    // --- s16le conversion ---
    {
        AudioBuffer samples = {0, 1, -1, 32767, -32768, 258};
        PcmChunk bytes = AudioFrameCodec::samples_to_bytes(samples);
        ASSERT(bytes.size() == 12);
        ASSERT(bytes[2] == '\x01' && bytes[3] == '\x00');
        ASSERT(bytes[4] == '\xff' && bytes[5] == '\xff');
        ASSERT(bytes[10] == '\x02' && bytes[11] == '\x01');
        ASSERT(AudioFrameCodec::bytes_to_samples(bytes) == samples);

        // Trailing odd byte is ignored
        AudioBuffer odd = AudioFrameCodec::bytes_to_samples(std::string("\x10\x00\x20", 3));
        ASSERT(odd.size() == 1 && odd[0] == 16);
    }

    if (failed == 0) {
        std::cout << "test_wire_protocol: all assertions passed\n";
        return 0;
    }
    std::cerr << "test_wire_protocol: " << failed << " assertion(s) failed\n";
    return 1;
}
