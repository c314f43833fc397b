#pragma once

#include <algorithm>
#include <initializer_list>

namespace docredact {

/**
 * @brief Axis-aligned rectangle in PDF user space (y grows upward)
 *
 * Normalized so that x1 <= x2 and y1 <= y2.
 */
struct Rect {
    double x1 = 0.0;
    double y1 = 0.0;
    double x2 = 0.0;
    double y2 = 0.0;

    [[nodiscard]] static Rect from_xywh(double x, double y, double w, double h) {
        return normalized(x, y, x + w, y + h);
    }

    [[nodiscard]] static Rect normalized(double ax, double ay, double bx, double by) {
        return {std::min(ax, bx), std::min(ay, by), std::max(ax, bx), std::max(ay, by)};
    }

    [[nodiscard]] double width() const { return x2 - x1; }
    [[nodiscard]] double height() const { return y2 - y1; }
    [[nodiscard]] double area() const { return width() * height(); }

    // Strict inequality: rectangles that only touch at an edge do not intersect
    [[nodiscard]] bool intersects(const Rect& o) const {
        return x1 < o.x2 && o.x1 < x2 && y1 < o.y2 && o.y1 < y2;
    }

    [[nodiscard]] bool contains(const Rect& o) const {
        return x1 <= o.x1 && y1 <= o.y1 && o.x2 <= x2 && o.y2 <= y2;
    }

    [[nodiscard]] Rect united(const Rect& o) const {
        return {std::min(x1, o.x1), std::min(y1, o.y1), std::max(x2, o.x2), std::max(y2, o.y2)};
    }

    [[nodiscard]] Rect padded(double dx, double dy) const {
        return {x1 - dx, y1 - dy, x2 + dx, y2 + dy};
    }

    bool operator==(const Rect&) const = default;
};

/**
 * @brief PDF affine matrix [a b c d e f] in row-vector convention
 *
 * A point (x, y) maps to (a*x + c*y + e, b*x + d*y + f). Composition
 * `m1 * m2` applies m1 first, then m2.
 */
struct Matrix {
    double a = 1.0;
    double b = 0.0;
    double c = 0.0;
    double d = 1.0;
    double e = 0.0;
    double f = 0.0;

    [[nodiscard]] static Matrix identity() { return {}; }

    [[nodiscard]] static Matrix translate(double tx, double ty) {
        return {1.0, 0.0, 0.0, 1.0, tx, ty};
    }

    [[nodiscard]] Matrix operator*(const Matrix& m) const {
        return {
            a * m.a + b * m.c,
            a * m.b + b * m.d,
            c * m.a + d * m.c,
            c * m.b + d * m.d,
            e * m.a + f * m.c + m.e,
            e * m.b + f * m.d + m.f,
        };
    }

    void apply(double x, double y, double& ox, double& oy) const {
        ox = a * x + c * y + e;
        oy = b * x + d * y + f;
    }

    /// Transform a rectangle and return the axis-aligned bounds of the result
    [[nodiscard]] Rect transform(const Rect& r) const {
        double xs[4];
        double ys[4];
        apply(r.x1, r.y1, xs[0], ys[0]);
        apply(r.x2, r.y1, xs[1], ys[1]);
        apply(r.x1, r.y2, xs[2], ys[2]);
        apply(r.x2, r.y2, xs[3], ys[3]);
        return {
            std::min({xs[0], xs[1], xs[2], xs[3]}),
            std::min({ys[0], ys[1], ys[2], ys[3]}),
            std::max({xs[0], xs[1], xs[2], xs[3]}),
            std::max({ys[0], ys[1], ys[2], ys[3]}),
        };
    }

    bool operator==(const Matrix&) const = default;
};

} // namespace docredact
