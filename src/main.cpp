#include "audio/ffmpeg_decoder.hpp"
#include "audio/portaudio_microphone.hpp"
#include "audio/portaudio_player.hpp"
#include "call/voice_client.hpp"
#include "config/config.hpp"
#include "net/beast_http_fetcher.hpp"
#include "net/channel_manager.hpp"
#include "net/session_directory.hpp"
#include "net/websocket_channel.hpp"
#include "runtime/asio_event_loop.hpp"
#include "storage/call_journal.hpp"
#include "ui/display_manager.hpp"
#include "ui/keyboard_handler.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

using namespace voxcall;

namespace {

constexpr std::chrono::milliseconds REDRAW_INTERVAL{100};

struct Args {
    bool list_devices = false;
    std::optional<std::string> config_path;
    std::optional<std::string> server_url;
    std::optional<std::string> api_url;
    std::optional<int> input_device;
    std::optional<int> output_device;
    std::optional<int> sample_rate;
    std::optional<std::string> db_path;
    bool no_journal = false;
    bool verbose = false;
};

void print_help() {
    std::cout << "voxcall: real-time voice call client\n"
              << "      --config <path>          Config file (default XDG)\n"
              << "      --url <ws-url>           Voice server WebSocket URL\n"
              << "      --api <http-url>         Session API base URL\n"
              << "  -l, --list-devices           List audio devices\n"
              << "  -d, --device <index>         Input device index\n"
              << "      --output-device <index>  Output device index\n"
              << "      --sr <Hz>                Capture sample rate (default 16000)\n"
              << "      --db <path>              Latency journal path (default XDG)\n"
              << "      --no-journal             Do not write the latency journal\n"
              << "  -v, --verbose                Print settings on startup\n"
              << "  -h, --help                   Show this help\n";
}

int parse_int(const std::string& flag, const char* value) {
    try {
        return std::stoi(value);
    } catch (const std::logic_error&) {
        throw std::runtime_error("invalid value for " + flag + ": " + value);
    }
}

Args parse_args(int argc, char** argv) {
    Args a{};
    for (int i = 1; i < argc; ++i) {
        std::string s = argv[i];
        if      (s == "--list-devices" || s == "-l") a.list_devices = true;
        else if (s == "--config" && i + 1 < argc) a.config_path = argv[++i];
        else if (s == "--url" && i + 1 < argc) a.server_url = argv[++i];
        else if (s == "--api" && i + 1 < argc) a.api_url = argv[++i];
        else if ((s == "--device" || s == "-d") && i + 1 < argc) a.input_device = parse_int(s, argv[++i]);
        else if (s == "--output-device" && i + 1 < argc) a.output_device = parse_int(s, argv[++i]);
        else if (s == "--sr" && i + 1 < argc) a.sample_rate = parse_int(s, argv[++i]);
        else if (s == "--db" && i + 1 < argc) a.db_path = argv[++i];
        else if (s == "--no-journal") a.no_journal = true;
        else if (s == "--verbose" || s == "-v") a.verbose = true;
        else if (s == "--help" || s == "-h") {
            print_help();
            std::exit(0);
        }
        else throw std::runtime_error("unknown argument: " + s);
    }
    return a;
}

AppConfig resolve_config(const Args& args) {
    AppConfig cfg;
    cfg.db_path = default_db_path();
    apply_file_config(cfg, load_config_file(expand_path(args.config_path.value_or(default_config_path()))));
    apply_environment(cfg);

    if (args.server_url) cfg.server_url = *args.server_url;
    if (args.api_url) cfg.api_url = *args.api_url;
    if (args.input_device) cfg.input_device = args.input_device;
    if (args.output_device) cfg.output_device = args.output_device;
    if (args.sample_rate && *args.sample_rate > 0) cfg.sample_rate = *args.sample_rate;
    if (args.db_path) cfg.db_path = expand_path(*args.db_path);
    if (args.no_journal) cfg.journal = false;
    if (args.verbose) cfg.verbose = true;
    return cfg;
}

} // namespace

int main(int argc, char** argv) {
    Args args;
    try {
        args = parse_args(argc, argv);
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        print_help();
        return 2;
    }

    if (args.list_devices) {
        for (const auto& d : PortAudioMicrophone::listDevices()) {
            std::cout << d.index << ": " << d.name
                      << " (in " << d.maxInputChannels << ", out " << d.maxOutputChannels
                      << ", " << d.defaultSampleRate << " Hz)\n";
        }
        return 0;
    }

    const AppConfig cfg = resolve_config(args);
    if (cfg.verbose) {
        std::cout << "Server:  " << cfg.server_url << "\n"
                  << "API:     " << cfg.api_url << "\n"
                  << "Capture: " << cfg.sample_rate << " Hz, " << cfg.frame_ms << " ms frames\n"
                  << "Journal: " << (cfg.journal ? cfg.db_path : std::string("off")) << "\n";
    }

    boost::asio::io_context io;
    AsioEventLoop loop(io);

    try {
        std::unique_ptr<CallJournal> journal;
        if (cfg.journal) {
            try {
                journal = std::make_unique<CallJournal>(cfg.db_path);
            } catch (const std::runtime_error& e) {
                std::cerr << "Warning: journal disabled: " << e.what() << "\n";
            }
        }

        PortAudioMicrophone microphone(loop, {cfg.input_device, cfg.sample_rate, cfg.frame_ms});
        PortAudioPlayer player(loop, cfg.output_device);
        FfmpegDecoder decoder(loop);
        ChannelManager channel(WebSocketChannel::factory(io), cfg.server_url);
        BeastHttpFetcher fetcher(io);
        SessionDirectory sessions(fetcher, cfg.api_url);

        VoiceClient client(loop, channel, microphone, decoder, player, journal.get());
        DisplayManager display(client, sessions);

        client.setChangeCallback([&display]() { display.requestUpdate(); });
        sessions.setUpdateCallback([&display](const std::vector<SessionRecord>&) { display.requestUpdate(); });

        bool quitting = false;
        auto quit = [&]() {
            if (quitting) return;
            quitting = true;
            client.hangUp();
            display.updateDisplay(true);
            // Let the end_call frame and close handshake flush.
            loop.schedule(std::chrono::milliseconds(200), [&io]() { io.stop(); });
        };

        auto onKey = [&](char key) {
            switch (key) {
            case 'c':
                client.startCall();
                break;
            case ' ':
                if (client.capturing()) client.endTurn();
                else client.beginTurn();
                break;
            case 'h':
                client.hangUp();
                break;
            case 't':
                display.toggleTrace();
                break;
            case 's':
                if (display.view() == DisplayManager::View::Sessions) {
                    display.setView(DisplayManager::View::Call);
                } else {
                    display.setView(DisplayManager::View::Sessions);
                    sessions.listSessions();
                }
                break;
            case 'q':
            case KeyboardHandler::CTRL_C:
                quit();
                break;
            default:
                break;
            }
            display.requestUpdate();
        };

        boost::asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int) {
            if (!ec) quit();
        });

        KeyboardHandler keyboard;
        keyboard.setKeyCallback([&loop, &onKey](char key) {
            loop.post([&onKey, key]() { onKey(key); });
        });
        if (!keyboard.start()) {
            std::cerr << "Warning: keyboard control unavailable\n";
        }

        std::function<void()> redraw;
        std::unique_ptr<EventLoop::Timer> redrawTimer;
        redraw = [&]() {
            display.updateDisplay();
            redrawTimer = loop.schedule(REDRAW_INTERVAL, redraw);
        };
        redraw();

        io.run();
        keyboard.stop();
        if (redrawTimer) redrawTimer->cancel();
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
