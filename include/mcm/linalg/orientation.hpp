/**
 * @file orientation.hpp
 * @brief an orientation as three orthonormal basis vectors
 */
#pragma once

#include "mcm/linalg/vector.hpp"

namespace mcm::linalg
{

/**
 * @brief immutable orthonormal basis (e1, e2, e3)
 *
 * invariants:
 * - every vector is 3-D with |e|^2 within one ULP of 1
 * - every pair has an exactly zero dot product
 */
class OrientationVectors3
{
  public:
    /**
     * @brief validate and wrap three basis vectors
     *
     * @throws std::invalid_argument if any vector is not a 3-D unit vector or
     *         any pair is not orthogonal
     */
    [[nodiscard]] static auto create_from_orthogonal_unit_basis_vectors(const Vector &e1, const Vector &e2,
                                                                         const Vector &e3) -> OrientationVectors3;

    /// (1,0,0), (0,1,0), (0,0,1)
    [[nodiscard]] static auto global_basis() -> OrientationVectors3;

    [[nodiscard]] auto e1() const noexcept -> const Vector & { return e1_; }
    [[nodiscard]] auto e2() const noexcept -> const Vector & { return e2_; }
    [[nodiscard]] auto e3() const noexcept -> const Vector & { return e3_; }

    [[nodiscard]] friend auto operator==(const OrientationVectors3 &lhs, const OrientationVectors3 &rhs) noexcept
        -> bool
    {
        return lhs.e1_ == rhs.e1_ && lhs.e2_ == rhs.e2_ && lhs.e3_ == rhs.e3_;
    }

  private:
    OrientationVectors3(Vector e1, Vector e2, Vector e3);

    Vector e1_;
    Vector e2_;
    Vector e3_;
};

} // namespace mcm::linalg
