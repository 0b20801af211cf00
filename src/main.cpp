//
// Created by Malik T on 13/08/2025.
//

//
// main.cpp: headless self-play harness running seeded games with a random player
//

#include <charconv>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <memory>
#include <optional>
#include <print>
#include <string>

#include "core/Exception.hpp"
#include "core/Format.hpp"
#include "core/RandomPlayer.hpp"
#include "core/Session.hpp"
#include "debug/AuditLogger.hpp"
#include "debug/RecordingPlayer.hpp"
#include "save/Codec.hpp"

namespace
{
    struct AutoplayConfig
    {
        std::uint64_t seed{123456789ULL};
        std::uint64_t draw{1};
        std::uint64_t games{1};
        std::uint64_t steps{20'000};
        std::string   log_dir{};  // empty: no transcripts
        std::string   save_path{}; // empty: last game is not saved
    };

    auto ParseArgs(int argc, char** argv) -> AutoplayConfig
    {
        AutoplayConfig cfg{};

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            auto next_uint = [&](std::uint64_t& out)
            {
                if (i + 1 >= argc) { return false; }
                char const* s = argv[++i];
                auto res = std::from_chars(s, s + std::strlen(s), out);
                return res.ec == std::errc{};
            };

            auto next_str = [&](std::string& out)
            {
                if (i + 1 >= argc) { return false; }
                out = argv[++i];
                return true;
            };

            if (arg == "--seed")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.seed = v; }
            }
            else if (arg == "--draw")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.draw = v; }
            }
            else if (arg == "--games")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.games = v; }
            }
            else if (arg == "--steps")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.steps = v; }
            }
            else if (arg == "--log")
            {
                next_str(cfg.log_dir);
            }
            else if (arg == "--save")
            {
                next_str(cfg.save_path);
            }
        }
        return cfg;
    }

    struct Tally
    {
        std::uint64_t won{};
        std::uint64_t lost{};
        std::uint64_t unfinished{};
    };

    auto PlayOne(klondike::core::Config const& cfg, AutoplayConfig const& ac, Tally& tally)
        -> klondike::core::SessionRecord
    {
        using namespace klondike::core;

        auto player = std::make_unique<debug::RecordingPlayer>(std::make_unique<RandomPlayer>(cfg.seed + 1));
        Session session(cfg, std::move(player));
        debug::RecordingPlayer* rec = debug::AsRecording(session.PlayerPtr());

        std::optional<debug::AuditLogger> log;
        if (!ac.log_dir.empty())
        {
            log.emplace(std::format("{}/game_{}.log", ac.log_dir, cfg.seed));
            log->start(session);
        }

        session.Start();
        MoveOutcome out = MoveOutcome::Applied;
        for (std::uint64_t step{}; step < ac.steps; ++step)
        {
            out = session.Step();
            if (log && rec && rec->HasLast())
            {
                log->turn(*rec->LastView(), rec->Last());
                if (auto const b = rec->TakeBury()) log->bury(*b);
                log->outcome(out, session.Message());
            }
            if (out == MoveOutcome::Won || out == MoveOutcome::Lost) break;
        }
        session.Pause();

        if (log) log->end(session);

        switch (session.Status())
        {
        case SessionStatus::Won: ++tally.won; break;
        case SessionStatus::Lost: ++tally.lost; break;
        case SessionStatus::Playing: ++tally.unfinished; break;
        }

        std::print("[klondike] seed={} {} after {} moves, {} ms\n", cfg.seed, to_string(session.Status()),
                   session.MoveCount(), session.Elapsed().count());
        return session.ToRecord();
    }
}

int main(int argc, char** argv)
{
    using namespace klondike::core;

    AutoplayConfig const ac = ParseArgs(argc, argv);

    std::optional<DrawMode> const mode = DrawModeFromCount(ac.draw);
    if (!mode)
    {
        std::print(stderr, "[klondike] --draw must be 1 or 3, got {}\n", ac.draw);
        return 2;
    }

    std::print("[klondike] {} game(s), {} from seed {}\n", ac.games, to_string(*mode), ac.seed);

    try
    {
        if (!ac.log_dir.empty()) std::filesystem::create_directories(ac.log_dir);

        Tally tally{};
        std::optional<SessionRecord> last;
        for (std::uint64_t g{}; g < ac.games; ++g)
        {
            Config const cfg{.draw_mode = *mode, .seed = ac.seed + g};
            last = PlayOne(cfg, ac, tally);
        }

        std::print("[klondike] won={} lost={} unfinished={}\n", tally.won, tally.lost, tally.unfinished);

        if (!ac.save_path.empty() && last)
        {
            std::vector<std::uint8_t> const bytes = save::EncodeSessionBytes(*last);
            std::ofstream out(ac.save_path, std::ios::binary | std::ios::trunc);
            out.write(reinterpret_cast<char const*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
            if (!out)
            {
                std::print(stderr, "[klondike] could not write {}\n", ac.save_path);
                return 1;
            }
            std::print("[klondike] saved last game to {} ({} bytes)\n", ac.save_path, bytes.size());
        }
    }
    catch (OmegaException<error::Code> const& e)
    {
        std::print(stderr, "{}", e);
        return 1;
    }
    catch (std::filesystem::filesystem_error const& e)
    {
        std::print(stderr, "[klondike] {}\n", e.what());
        return 1;
    }

    return 0;
}
