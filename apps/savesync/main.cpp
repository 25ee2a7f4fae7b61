// /////////////////////////////////////////////////////////////////////////////
/// @file main.cpp
/// @brief Command line save-sync peer.
///
/// Loads the local controller save, exchanges saves with every peer over
/// UDP and prints what each player ended up with.
///
///   cinder-savesync --player 0 --players 2 --port 7777 \
///                   --peer 127.0.0.1:7777 --peer 127.0.0.1:7778 \
///                   [--save-mode synchronized --sync-save host.ncsv]
// /////////////////////////////////////////////////////////////////////////////

#include <cinder/engine/Config.hpp>
#include <cinder/engine/SessionBootstrap.hpp>
#include <cinder/core/Constants.hpp>
#include <cinder/core/Log.hpp>
#include <cinder/core/Types.hpp>
#include <cinder/math/StateHash.hpp>
#include <cinder/net/transport/SocketTransport.hpp>
#include <cinder/save/SaveFile.hpp>
#include <cinder/save/SaveStore.hpp>

#include <charconv>
#include <chrono>
#include <cstdio>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

struct Options
{
    cinder::core::u8              player{0};
    cinder::core::u8              players{2};
    cinder::core::u16             port{cinder::core::kDefaultPort};
    std::vector<std::string>      peers;
    std::string                   saveDir{"saves"};
    std::optional<cinder::core::u32> timeoutMs;
    cinder::save::SaveMode        saveMode{cinder::save::SaveMode::PerPlayer};
    std::string                   syncSave;
};

void usage(const char *argv0)
{
    std::fprintf(stderr,
                 "usage: %s --player N --players N [--port P] --peer host:port... "
                 "[--save-dir DIR] [--timeout-ms MS] [--save-mode MODE] [--sync-save FILE]\n"
                 "  --peer is repeated once per player, in player order (own entry included)\n"
                 "  MODE is per-player (default), synchronized or new-game\n",
                 argv0);
}

template <typename T>
bool parseNumber(std::string_view text, T &out)
{
    const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc{} && end == text.data() + text.size();
}

cinder::core::Expected<Options> parseArgs(int argc, char *argv[])
{
    using cinder::core::ErrorCode;
    using cinder::core::makeError;

    Options opts;
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view flag{argv[i]};
        if (i + 1 >= argc)
        {
            return makeError(ErrorCode::kInvalidArgument, std::format("{} expects a value", flag));
        }
        const std::string_view value{argv[++i]};

        bool ok = true;
        if (flag == "--player")
            ok = parseNumber(value, opts.player);
        else if (flag == "--players")
            ok = parseNumber(value, opts.players);
        else if (flag == "--port")
            ok = parseNumber(value, opts.port);
        else if (flag == "--peer")
            opts.peers.emplace_back(value);
        else if (flag == "--save-dir")
            opts.saveDir = value;
        else if (flag == "--timeout-ms")
        {
            cinder::core::u32 ms = 0;
            ok = parseNumber(value, ms);
            opts.timeoutMs = ms;
        }
        else if (flag == "--save-mode")
        {
            const auto mode = cinder::save::parseSaveMode(value);
            ok = mode.has_value();
            opts.saveMode = mode.value_or(cinder::save::SaveMode::PerPlayer);
        }
        else if (flag == "--sync-save")
            opts.syncSave = value;
        else
            return makeError(ErrorCode::kInvalidArgument, std::format("unknown option {}", flag));

        if (!ok)
        {
            return makeError(ErrorCode::kInvalidArgument, std::format("bad value '{}' for {}", value, flag));
        }
    }

    if (opts.peers.size() != opts.players)
    {
        return makeError(ErrorCode::kInvalidArgument,
                         std::format("{} --peer entries for {} players", opts.peers.size(), opts.players));
    }
    if (opts.saveMode == cinder::save::SaveMode::Synchronized && opts.syncSave.empty())
    {
        return makeError(ErrorCode::kInvalidArgument, "--save-mode synchronized needs --sync-save");
    }
    return opts;
}

} // namespace

int main(int argc, char *argv[])
{
    using namespace cinder;

    auto opts = parseArgs(argc, argv);
    if (!opts)
    {
        core::Log::error(opts.error().message());
        usage(argv[0]);
        return 2;
    }

    save::SaveConfig saveConfig{opts->saveMode, std::nullopt};
    if (!opts->syncSave.empty())
    {
        auto data = save::SaveFile::read(opts->syncSave);
        if (!data)
        {
            core::Log::error(data.error().message());
            return 1;
        }
        saveConfig.synchronizedSave = std::move(*data);
    }

    auto builder = engine::Config::Builder{}
        .playerCount(opts->players)
        .localPlayer(opts->player)
        .saveDirectory(opts->saveDir)
        .saveConfig(std::move(saveConfig));
    if (opts->timeoutMs)
    {
        builder.syncTimeout(std::chrono::milliseconds{*opts->timeoutMs});
    }
    const auto config = builder.build();

    if (auto valid = config.validate(); !valid)
    {
        core::Log::error(valid.error().message());
        return 2;
    }

    // One sockaddr-sized blob per player, in player order.
    std::vector<std::vector<core::byte>> addressStorage(opts->players,
                                                        std::vector<core::byte>(net::transport::socketAddressSize()));
    std::vector<const void *> peers(opts->players, nullptr);
    for (core::u8 p = 0; p < opts->players; ++p)
    {
        if (auto parsed = net::transport::parseSocketAddress(opts->peers[p], addressStorage[p].data()); !parsed)
        {
            core::Log::error(parsed.error().message());
            return 2;
        }
        peers[p] = addressStorage[p].data();
    }

    save::SaveStore store{config.saveDirectory()};
    if (auto loaded = store.load(); !loaded)
    {
        core::Log::error(loaded.error().message());
        return 1;
    }
    save::SaveSlots local;
    store.prefill(local, config.localPlayerMask(), config.playerCount());
    std::optional<core::Bytes> localSave;
    if (const auto bytes = local.read(config.localPlayer()))
    {
        localSave.emplace(bytes->begin(), bytes->end());
    }

    net::transport::SocketTransport transport{opts->port};
    if (auto opened = transport.open(); !opened)
    {
        core::Log::error(opened.error().message());
        return 1;
    }

    engine::SessionBootstrap bootstrap{config, transport, peers};
    auto slots = bootstrap.run(std::move(localSave));
    transport.close();

    if (!slots)
    {
        std::fprintf(stderr, "%s\n", slots.error().message().c_str());
        return 1;
    }

    for (core::u32 p = 0; p < config.playerCount(); ++p)
    {
        if (const auto data = slots->read(p))
        {
            std::printf("player %u: %zu bytes, hash %08x\n", p, data->size(), math::contentHash(*data));
        }
        else
        {
            std::printf("player %u: no save\n", p);
        }
    }
    return 0;
}
