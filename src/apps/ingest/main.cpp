// /////////////////////////////////////////////////////////////////////////////
/// @file main.cpp
/// @brief seis-ingest entry-point.
///
/// Attaches a serial line and/or a push endpoint, prints every decoded
/// sample on stdout and optionally emits simulated sensor frames.
// /////////////////////////////////////////////////////////////////////////////

#include <seis/stream/BatchQueue.hpp>
#include <seis/stream/IngestConfig.hpp>
#include <seis/stream/Ingestor.hpp>
#include <seis/transport/PushTransport.hpp>
#include <seis/transport/SerialTransport.hpp>
#include <seis/protocol/TestSignalGenerator.hpp>
#include <seis/core/Constants.hpp>
#include <seis/core/Log.hpp>
#include <seis/core/Types.hpp>

#include <atomic>
#include <charconv>
#include <csignal>
#include <cstdio>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace {

using namespace std::chrono_literals;

std::atomic<bool> gStop{false};

void onSignal(int) { gStop.store(true); }

struct Options
{
    std::optional<std::string> serialPath;
    std::optional<std::string> pushEndpoint;
    seis::core::u32            baud{seis::core::kDefaultBaudRate};
    seis::core::u32            stepMs{10};
    seis::core::u32            simulate{0};
    seis::core::u32            durationS{0};
    bool                       verbose{false};
};

void usage(const char* program)
{
    std::fprintf(stderr,
                 "usage: %s [--serial PATH] [--baud N] [--push HOST:PORT]\n"
                 "          [--step-ms N] [--simulate N] [--duration S] [--verbose]\n",
                 program);
}

std::optional<seis::core::u32> parseUnsigned(std::string_view text)
{
    seis::core::u32 value = 0;
    const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size())
        return std::nullopt;
    return value;
}

std::optional<Options> parseArgs(int argc, char* argv[])
{
    Options options;
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg{argv[i]};
        const bool hasValue = i + 1 < argc;

        auto number = [&](seis::core::u32& out) {
            if (!hasValue)
                return false;
            auto parsed = parseUnsigned(argv[++i]);
            if (!parsed)
                return false;
            out = *parsed;
            return true;
        };

        if (arg == "--serial" && hasValue)
            options.serialPath = argv[++i];
        else if (arg == "--push" && hasValue)
            options.pushEndpoint = argv[++i];
        else if (arg == "--baud")
        {
            if (!number(options.baud))
                return std::nullopt;
        }
        else if (arg == "--step-ms")
        {
            if (!number(options.stepMs) || options.stepMs == 0)
                return std::nullopt;
        }
        else if (arg == "--simulate")
        {
            if (!number(options.simulate))
                return std::nullopt;
        }
        else if (arg == "--duration")
        {
            if (!number(options.durationS))
                return std::nullopt;
        }
        else if (arg == "--verbose")
            options.verbose = true;
        else
            return std::nullopt;
    }
    if (!options.serialPath && !options.pushEndpoint)
        return std::nullopt;
    return options;
}

void printSample(const seis::protocol::Sample& sample)
{
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        sample.timestamp.time_since_epoch()).count();
    const auto channel = seis::protocol::channelName(sample.channel);
    std::printf("%lld %.*s %.6g\n",
                static_cast<long long>(ms),
                static_cast<int>(channel.size()), channel.data(),
                sample.amplitude);
}

} // namespace

int main(int argc, char* argv[])
{
    using namespace seis;

    const auto options = parseArgs(argc, argv);
    if (!options)
    {
        usage(argv[0]);
        return 2;
    }

    auto builder = stream::IngestConfig::Builder{};
    builder.sampleStep(std::chrono::milliseconds{options->stepMs})
           .logLevel(options->verbose ? core::LogLevel::kDebug : core::LogLevel::kInfo)
           .baudRate(options->baud);
    if (options->serialPath)
        builder.serialPort(*options->serialPath);
    if (options->pushEndpoint)
    {
        const auto colon = options->pushEndpoint->rfind(':');
        std::optional<core::u32> port;
        if (colon != std::string::npos)
            port = parseUnsigned(std::string_view{*options->pushEndpoint}.substr(colon + 1));
        if (!port || *port == 0 || *port > 0xFFFF)
        {
            core::Log::error("invalid push endpoint " + *options->pushEndpoint);
            return 2;
        }
        builder.pushHost(options->pushEndpoint->substr(0, colon))
               .pushPort(static_cast<core::u16>(*port));
    }

    auto config = builder.build();
    if (!config)
    {
        core::Log::error(config.error().format());
        return 2;
    }
    core::Log::setMinLevel(config->logLevel());
    core::Log::info("=== seis-ingest ===");

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    std::unique_ptr<transport::SerialTransport> serial;
    std::unique_ptr<transport::PushTransport> push;

    stream::BatchQueue queue{config->queueCapacity()};
    stream::Ingestor ingestor{*config};
    ingestor.setErrorHandler([](const core::Error& error) {
        core::Log::debug("decode error: " + error.message());
    });

    auto subscribed = ingestor.subscribe(queue.subscriber());
    if (!subscribed)
    {
        core::Log::error(subscribed.error().format());
        return 1;
    }

    if (options->serialPath)
    {
        serial = std::make_unique<transport::SerialTransport>(config->serial());
        if (auto ok = ingestor.attach(*serial); !ok)
        {
            core::Log::error("serial attach failed: " + ok.error().format());
            return 1;
        }
    }
    if (options->pushEndpoint)
    {
        transport::PushCallbacks lifecycle;
        lifecycle.onDisconnect = [] { gStop.store(true); };
        push = std::make_unique<transport::PushTransport>(config->push());
        if (auto ok = ingestor.attach(*push, std::move(lifecycle)); !ok)
        {
            core::Log::error("push attach failed: " + ok.error().format());
            ingestor.detachAll();
            return 1;
        }
    }

    protocol::TestSignalGenerator generator;
    core::u32 simulated = 0;
    std::optional<core::Clock::time_point> deadline;
    if (options->durationS != 0)
        deadline = core::Clock::now() + std::chrono::seconds{options->durationS};

    core::u64 printed = 0;
    while (!gStop.load())
    {
        if (simulated < options->simulate)
        {
            const auto frame = generator.tripleWaveform();
            if (push)
            {
                if (auto ok = push->write(frame); !ok)
                    core::Log::warn(ok.error().format());
            }
            else if (serial)
            {
                if (auto ok = serial->write(frame + "\n"); !ok)
                    core::Log::warn(ok.error().format());
            }
            ++simulated;
        }

        protocol::SampleBatch batch;
        if (queue.waitPop(batch, 100ms))
        {
            for (const auto& sample : batch)
                printSample(sample);
            printed += batch.size();
            std::fflush(stdout);
        }

        if (deadline && core::Clock::now() >= *deadline)
            break;
    }

    const auto detached = ingestor.detachAll();
    queue.close();

    core::Log::info("detached " + std::to_string(detached) + " transport(s), printed " +
                    std::to_string(printed) + " sample(s), dropped " +
                    std::to_string(queue.dropped()) + " batch(es)");
    return 0;
}
