//
// Created by Malik T on 24/08/2025.
//

#ifndef KLONDIKE_CODEC_HPP
#define KLONDIKE_CODEC_HPP

#include <cstddef>   // std::byte
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>
#include <flatbuffers/flatbuffers.h>

#include "../core/SessionRecord.hpp"
#include "../core/Types.hpp"

#include "generated/flatbuffers/klondike_save_generated.h"

namespace klondike::core::save
{
    inline constexpr std::uint16_t SchemaVersion = 1;

    struct ParseError
    {
        std::string message;
    };

    auto ToFbSuit(core::Suit s) noexcept -> klondike::gen::save::Suit;
    auto FromFbSuit(klondike::gen::save::Suit s) noexcept -> std::optional<core::Suit>;

    auto ToFbDrawMode(core::DrawMode m) noexcept -> klondike::gen::save::DrawMode;
    auto FromFbDrawMode(klondike::gen::save::DrawMode m) noexcept -> std::optional<core::DrawMode>;

    // A finished, identifier-tagged SessionSave buffer.
    auto EncodeSession(core::SessionRecord const& record) -> flatbuffers::DetachedBuffer;
    auto EncodeSessionBytes(core::SessionRecord const& record) -> std::vector<std::uint8_t>;

    // Verifies the buffer before touching it. Layout rules (full deck, foundation
    // order) are left to Session::Load; this only rejects what cannot be a card.
    auto DecodeSession(std::span<std::byte const> bytes) -> std::expected<core::SessionRecord, ParseError>;
}

#endif //KLONDIKE_CODEC_HPP
