#pragma once

namespace teacup::layout
{
// Layout axis. Algorithms are written once against a main axis and its flip.
enum class Axis
{
    Horizontal,
    Vertical
};

// Orthogonal axis
constexpr Axis operator!(Axis axis)
{
    return axis == Axis::Horizontal ? Axis::Vertical : Axis::Horizontal;
}

// Stacking direction of a container
enum class LayoutMode
{
    LeftToRight,
    TopToBottom
};

constexpr Axis MainAxis(LayoutMode mode)
{
    return mode == LayoutMode::TopToBottom ? Axis::Vertical : Axis::Horizontal;
}

// Sizing policy for one axis
struct SizingMode
{
    enum class Kind
    {
        Fixed, // frozen at value
        Fit,   // exactly the content minimum
        Grow   // content minimum plus a share of the parent's leftover space
    };

    Kind kind = Kind::Fit;
    int value = 0; // only meaningful for Fixed

    static SizingMode Fixed(int v)
    {
        return {Kind::Fixed, v};
    }
    static SizingMode Fit()
    {
        return {Kind::Fit, 0};
    }
    static SizingMode Grow()
    {
        return {Kind::Grow, 0};
    }

    [[nodiscard]] bool IsFixed() const
    {
        return kind == Kind::Fixed;
    }
    [[nodiscard]] bool IsFit() const
    {
        return kind == Kind::Fit;
    }
    [[nodiscard]] bool IsGrow() const
    {
        return kind == Kind::Grow;
    }

    bool operator==(const SizingMode& other) const
    {
        return kind == other.kind && (kind != Kind::Fixed || value == other.value);
    }
    bool operator!=(const SizingMode& other) const
    {
        return !(*this == other);
    }
};

// Per-axis sizing policy of a node
struct Sizing
{
    SizingMode width;
    SizingMode height;

    static Sizing Fit()
    {
        return {SizingMode::Fit(), SizingMode::Fit()};
    }
    static Sizing Grow()
    {
        return {SizingMode::Grow(), SizingMode::Grow()};
    }
    static Sizing Fixed(int w, int h)
    {
        return {SizingMode::Fixed(w), SizingMode::Fixed(h)};
    }

    [[nodiscard]] const SizingMode& Along(Axis axis) const
    {
        return axis == Axis::Horizontal ? width : height;
    }
    [[nodiscard]] SizingMode& Along(Axis axis)
    {
        return axis == Axis::Horizontal ? width : height;
    }
};
} // namespace teacup::layout
