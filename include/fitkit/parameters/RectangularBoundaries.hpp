#ifndef FITKIT_RECTANGULAR_BOUNDARIES_HPP
#define FITKIT_RECTANGULAR_BOUNDARIES_HPP

#include "fitkit/interfaces/IParameterManager.hpp"
#include <Eigen/Dense>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace fitkit {
    /**
     * @brief Axis-aligned box [lower, upper] with a proposal sigma per parameter.
     */
    class RectangularBoundaries : public IParameterManager {
    public:
        /**
         * @param lower Lower bounds.
         * @param upper Upper bounds, same length as lower.
         * @param sigmas Proposal standard deviations; defaults to (upper - lower) / 6 when empty.
         * @throws InvalidParameterException If lower is empty, the lengths differ,
         *         lower[i] >= upper[i] for some i, or a sigma is not positive.
         */
        RectangularBoundaries(const Eigen::VectorXd& lower,
                              const Eigen::VectorXd& upper,
                              const Eigen::VectorXd& sigmas = Eigen::VectorXd());

        /**
         * @brief Build boundaries from a name-indexed bounds map, e.g. from readParamBounds().
         * @param names Parameter names, in parameter-vector order.
         * @param bounds Map of name to (lower, upper).
         * @throws InvalidParameterException If a name has no bounds entry.
         */
        static RectangularBoundaries fromBoundsMap(
            const std::vector<std::string>& names,
            const std::map<std::string, std::pair<double, double>>& bounds);

        size_t getParameterCount() const override;

        /**
         * @throws std::out_of_range If index is invalid.
         */
        double getSigmaForParamIndex(int index) const override;

        /**
         * @brief Clamp each entry into [lower, upper].
         * @throws DimensionMismatchException If the vector length differs from getParameterCount().
         */
        Eigen::VectorXd applyConstraints(const Eigen::VectorXd& parameters) const override;

        /**
         * @throws DimensionMismatchException If the vector length differs from getParameterCount().
         */
        bool isInside(const Eigen::VectorXd& parameters) const override;

        double getLowerBoundForParamIndex(int idx) const override;
        double getUpperBoundForParamIndex(int idx) const override;

        const Eigen::VectorXd& getLower() const { return lower_; }
        const Eigen::VectorXd& getUpper() const { return upper_; }

    private:
        void checkIndex(int idx, const char* functionName) const;

        Eigen::VectorXd lower_;
        Eigen::VectorXd upper_;
        Eigen::VectorXd sigmas_;
    };
}

#endif // FITKIT_RECTANGULAR_BOUNDARIES_HPP
