//
// Created by Malik T on 14/08/2025.
//

#ifndef KLONDIKE_TYPES_HPP
#define KLONDIKE_TYPES_HPP

#define KLD_ENABLE_TEST_HOOKS true

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <utility>
#include <vector>

namespace klondike::core::constants
{
    inline constexpr size_t DeckSize = 52;
    inline constexpr size_t RanksPerSuit = 13;
    inline constexpr size_t FoundationCount = 4;
    inline constexpr size_t TableauCount = 7;
    inline constexpr size_t DefaultUndoCapacity = 100;
    // Draw-3 only: burials allowed without intervening progress before the game is lost
    inline constexpr uint32_t MaxConsecutiveBurials = 2;
}

namespace klondike::core
{
    enum class Suit : uint8_t
    {
        Hearts = 0,
        Diamonds,
        Clubs,
        Spades
    };

    enum class Rank : uint8_t
    {
        Ace = 1,
        Two,
        Three,
        Four,
        Five,
        Six,
        Seven,
        Eight,
        Nine,
        Ten,
        Jack,
        Queen,
        King
    };

    enum class Colour : uint8_t
    {
        Red,
        Black
    };

    inline constexpr std::array<Suit, 4> AllSuits{Suit::Hearts, Suit::Diamonds, Suit::Clubs, Suit::Spades};

    constexpr auto ColourOf(Suit const s) noexcept -> Colour
    {
        switch (s)
        {
        case Suit::Hearts:
        case Suit::Diamonds: return Colour::Red;
        case Suit::Clubs:
        case Suit::Spades: return Colour::Black;
        }
        return Colour::Black;
    }

    // Immutable value. Flipping yields a new card; piles replace cards, never edit them.
    class Card
    {
    public:
        Card() = delete;
        constexpr Card(Rank rank, Suit suit, bool face_up = false) noexcept :
            rank_(rank), suit_(suit), face_up_(face_up) {}

        [[nodiscard]] constexpr auto rank() const noexcept -> Rank { return rank_; }
        [[nodiscard]] constexpr auto suit() const noexcept -> Suit { return suit_; }
        [[nodiscard]] constexpr auto face_up() const noexcept -> bool { return face_up_; }
        [[nodiscard]] constexpr auto colour() const noexcept -> Colour { return ColourOf(suit_); }

        [[nodiscard]] constexpr auto IsOppositeColour(Card const& other) const noexcept -> bool
        {
            return colour() != other.colour();
        }

        [[nodiscard]] constexpr auto FaceUp() const noexcept -> Card { return Card{rank_, suit_, true}; }
        [[nodiscard]] constexpr auto FaceDown() const noexcept -> Card { return Card{rank_, suit_, false}; }

        // Face-up state is part of identity: a face-down five differs from a face-up five.
        friend constexpr auto operator==(Card const&, Card const&) noexcept -> bool = default;

    private:
        Rank rank_;
        Suit suit_;
        bool face_up_;
    };

    constexpr auto RankValue(Rank const r) noexcept -> int { return static_cast<int>(r); }

    // Ace..King of one of the four suits. Cards decoded from outside input need not be.
    constexpr auto IsWellFormed(Card const& c) noexcept -> bool
    {
        return RankValue(c.rank()) >= RankValue(Rank::Ace) && RankValue(c.rank()) <= RankValue(Rank::King)
            && std::to_underlying(c.suit()) <= std::to_underlying(Suit::Spades);
    }

    using Pile = std::vector<Card>;

    enum class DrawMode : uint8_t
    {
        One = 1,
        Three = 3
    };

    constexpr auto DrawModeFromCount(uint64_t const count) noexcept -> std::optional<DrawMode>
    {
        if (count == 1) return DrawMode::One;
        if (count == 3) return DrawMode::Three;
        return std::nullopt;
    }

    struct Config
    {
        DrawMode draw_mode{DrawMode::One};
        uint64_t seed{std::random_device{}()};
        size_t   undo_capacity{constants::DefaultUndoCapacity};
    };
}

#endif //KLONDIKE_TYPES_HPP
