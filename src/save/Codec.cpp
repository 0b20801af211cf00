//
// Created by Malik T on 24/08/2025.
//
#include "Codec.hpp"

#include <algorithm>
#include <format>
#include <utility>

namespace fb = klondike::gen::save;

namespace
{
    // Verify enum layouts (one value per enum is sufficient to catch drift)
    static_assert(static_cast<int>(klondike::core::Suit::Hearts) == static_cast<int>(fb::Suit::Hearts));
    static_assert(static_cast<int>(klondike::core::Suit::Spades) == static_cast<int>(fb::Suit::Spades));
    static_assert(static_cast<int>(klondike::core::DrawMode::Three) == static_cast<int>(fb::DrawMode::Three));
}

namespace klondike::core::save
{
    auto ToFbSuit(Suit const s) noexcept -> fb::Suit
    {
        switch (s)
        {
        case Suit::Hearts: return fb::Suit::Hearts;
        case Suit::Diamonds: return fb::Suit::Diamonds;
        case Suit::Clubs: return fb::Suit::Clubs;
        case Suit::Spades: return fb::Suit::Spades;
        }
        return fb::Suit::Hearts;
    }

    auto FromFbSuit(fb::Suit const s) noexcept -> std::optional<Suit>
    {
        switch (s)
        {
        case fb::Suit::Hearts: return Suit::Hearts;
        case fb::Suit::Diamonds: return Suit::Diamonds;
        case fb::Suit::Clubs: return Suit::Clubs;
        case fb::Suit::Spades: return Suit::Spades;
        }
        return std::nullopt;
    }

    auto ToFbDrawMode(DrawMode const m) noexcept -> fb::DrawMode
    {
        switch (m)
        {
        case DrawMode::One: return fb::DrawMode::One;
        case DrawMode::Three: return fb::DrawMode::Three;
        }
        return fb::DrawMode::One;
    }

    auto FromFbDrawMode(fb::DrawMode const m) noexcept -> std::optional<DrawMode>
    {
        switch (m)
        {
        case fb::DrawMode::One: return DrawMode::One;
        case fb::DrawMode::Three: return DrawMode::Three;
        }
        return std::nullopt;
    }

    // ---------- Encode ----------

    static auto ToFbPile(flatbuffers::FlatBufferBuilder& fbb, Pile const& pile)
        -> flatbuffers::Offset<fb::Pile>
    {
        std::vector<flatbuffers::Offset<fb::Card>> cards;
        cards.reserve(pile.size());
        for (Card const& c : pile)
        {
            cards.push_back(fb::CreateCard(fbb, static_cast<uint8_t>(RankValue(c.rank())),
                                           ToFbSuit(c.suit()), c.face_up()));
        }
        return fb::CreatePile(fbb, fbb.CreateVector(cards));
    }

    template <size_t N>
    static auto ToFbPiles(flatbuffers::FlatBufferBuilder& fbb, std::array<Pile, N> const& piles)
        -> flatbuffers::Offset<flatbuffers::Vector<flatbuffers::Offset<fb::Pile>>>
    {
        std::vector<flatbuffers::Offset<fb::Pile>> out;
        out.reserve(N);
        for (Pile const& p : piles) out.push_back(ToFbPile(fbb, p));
        return fbb.CreateVector(out);
    }

    auto EncodeSession(SessionRecord const& record) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;

        // children first, the builder cannot nest tables
        auto const stock = ToFbPile(fbb, record.state.stock);
        auto const waste = ToFbPile(fbb, record.state.waste);
        auto const foundations = ToFbPiles(fbb, record.state.foundations);
        auto const tableau = ToFbPiles(fbb, record.state.tableau);
        auto const board = fb::CreateBoard(fbb, stock, waste, foundations, tableau);

        fb::SessionSaveBuilder b(fbb);
        b.add_schema_version(SchemaVersion);
        b.add_board(board);
        b.add_move_count(record.move_count);
        b.add_elapsed_ms(static_cast<uint64_t>(std::max<int64_t>(record.elapsed.count(), 0)));
        b.add_draw_mode(ToFbDrawMode(record.draw_mode));
        if (record.made_progress_since_last_recycle)
            b.add_made_progress_since_last_recycle(*record.made_progress_since_last_recycle);
        if (record.consecutive_burials)
            b.add_consecutive_burials(*record.consecutive_burials);

        fb::FinishSessionSaveBuffer(fbb, b.Finish());
        return fbb.Release();
    }

    auto EncodeSessionBytes(SessionRecord const& record) -> std::vector<std::uint8_t>
    {
        flatbuffers::DetachedBuffer const buf = EncodeSession(record);
        return {buf.data(), buf.data() + buf.size()};
    }

    // ---------- Decode ----------

    static auto FromFbPile(fb::Pile const* src, Pile& out) -> std::expected<void, ParseError>
    {
        out.clear();
        // an omitted pile is an empty one
        if (src == nullptr || src->cards() == nullptr) return {};

        out.reserve(src->cards()->size());
        for (fb::Card const* c : *src->cards())
        {
            if (c->rank() < RankValue(Rank::Ace) || c->rank() > RankValue(Rank::King))
                return std::unexpected(ParseError{std::format("invalid rank {}", c->rank())});
            std::optional<Suit> const suit = FromFbSuit(c->suit());
            if (!suit)
                return std::unexpected(ParseError{std::format("invalid suit {}", static_cast<int>(c->suit()))});
            out.emplace_back(static_cast<Rank>(c->rank()), *suit, c->face_up());
        }
        return {};
    }

    template <size_t N>
    static auto FromFbPiles(flatbuffers::Vector<flatbuffers::Offset<fb::Pile>> const* src,
                            std::array<Pile, N>& out, std::string_view const what) -> std::expected<void, ParseError>
    {
        if (src == nullptr || src->size() != N)
            return std::unexpected(ParseError{std::format("expected {} {} piles", N, what)});

        for (size_t i{}; i < N; ++i)
        {
            if (auto r = FromFbPile(src->Get(static_cast<flatbuffers::uoffset_t>(i)), out[i]); !r)
                return r;
        }
        return {};
    }

    auto DecodeSession(std::span<std::byte const> bytes) -> std::expected<SessionRecord, ParseError>
    {
        if (bytes.size() < sizeof(flatbuffers::uoffset_t) + flatbuffers::kFileIdentifierLength)
            return std::unexpected(ParseError{"buffer too small"});

        auto const* data = reinterpret_cast<uint8_t const*>(bytes.data());
        if (!fb::SessionSaveBufferHasIdentifier(data))
            return std::unexpected(ParseError{"not a Klondike save"});

        flatbuffers::Verifier verifier(data, bytes.size());
        if (!fb::VerifySessionSaveBuffer(verifier))
            return std::unexpected(ParseError{"corrupt save"});

        fb::SessionSave const* save = fb::GetSessionSave(data);
        if (save->schema_version() > SchemaVersion)
            return std::unexpected(ParseError{std::format("save schema {} is newer than {}",
                                                          save->schema_version(), SchemaVersion)});

        fb::Board const* board = save->board();
        if (board == nullptr)
            return std::unexpected(ParseError{"save has no board"});

        SessionRecord out{};
        if (auto r = FromFbPile(board->stock(), out.state.stock); !r) return std::unexpected(r.error());
        if (auto r = FromFbPile(board->waste(), out.state.waste); !r) return std::unexpected(r.error());
        if (auto r = FromFbPiles(board->foundations(), out.state.foundations, "foundation"); !r)
            return std::unexpected(r.error());
        if (auto r = FromFbPiles(board->tableau(), out.state.tableau, "tableau"); !r)
            return std::unexpected(r.error());

        std::optional<DrawMode> const mode = FromFbDrawMode(save->draw_mode());
        if (!mode)
            return std::unexpected(ParseError{std::format("invalid draw mode {}", static_cast<int>(save->draw_mode()))});

        out.move_count = save->move_count();
        out.elapsed = std::chrono::milliseconds{static_cast<int64_t>(save->elapsed_ms())};
        out.draw_mode = *mode;
        if (auto const progress = save->made_progress_since_last_recycle(); progress.has_value())
            out.made_progress_since_last_recycle = progress.value();
        if (auto const burials = save->consecutive_burials(); burials.has_value())
            out.consecutive_burials = burials.value();

        return out;
    }
}
