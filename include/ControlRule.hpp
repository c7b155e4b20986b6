#pragma once
/**
 * @file ControlRule.hpp
 * @brief Control-drum speed policies.
 *
 * @details
 * The derivative assembly only knows the ControlRule interface: given the
 * current time and reactor state it asks for the drum angular speed
 * [deg/s]. Concrete policies:
 *  - ConstantSpeedRule : fixed speed (0 keeps the drums parked).
 *  - ScheduledSpeedRule: piecewise-constant speed table over time.
 *  - PowerSetpointRule : proportional drive toward a power setpoint.
 *
 * Rules are called at solver-chosen, not necessarily monotone, times and
 * must therefore be stateless.
 */

#include "common.hpp"
#include "State.hpp"

/**
 * @class ControlRule
 * @brief Strategy interface for the drum angular speed.
 */
class ControlRule
{
  public:
    virtual ~ControlRule() = default;

    /**
     * @brief Drum angular speed at time t for the given state.
     * @param t     Simulation time [s].
     * @param state Current reactor state.
     * @return d(drum_angle)/dt [deg/s].
     */
    virtual real_t drumSpeed(real_t t, const State& state) const = 0;

    /// Describe the rule in the layout accepted by fromJson().
    virtual json toJson() const = 0;

    /**
     * @brief Build a rule from its JSON description.
     *
     * ```
     * { "Type": "Constant", "Speed": 0.0 }
     * { "Type": "Schedule", "Times": [...], "Speeds": [...] }
     * { "Type": "PowerSetpoint", "Setpoint": ..., "Band": ..., "Speed": ...,
     *   "MinAngle": 0.0, "MaxAngle": 180.0 }
     * ```
     * @throws std::invalid_argument for unknown types or inconsistent tables.
     */
    static std::unique_ptr<ControlRule> fromJson(const json& ruleIn);
};

/**
 * @class ConstantSpeedRule
 * @brief Drums rotate at a fixed speed regardless of state.
 */
class ConstantSpeedRule : public ControlRule
{
  private:
    real_t speed;

  public:
    explicit ConstantSpeedRule(real_t speed_=0.0);

    real_t drumSpeed(real_t t, const State& state) const override;
    json toJson() const override;
};

/**
 * @class ScheduledSpeedRule
 * @brief Piecewise-constant speed: speeds[k] on [times[k], times[k+1]).
 *
 * Before times[0] the drums are at rest; the last speed holds indefinitely.
 */
class ScheduledSpeedRule : public ControlRule
{
  private:
    vec_real times;
    vec_real speeds;

  public:
    /// @throws std::invalid_argument on empty, unequal or non-increasing tables.
    ScheduledSpeedRule(vec_real times_, vec_real speeds_);

    real_t drumSpeed(real_t t, const State& state) const override;
    json toJson() const override;
};

/**
 * @class PowerSetpointRule
 * @brief Saturating proportional drive of the drums toward a power setpoint.
 *
 * @details
 * The commanded speed is
 *
 *     speed * clamp((setpoint - power) / band, -1, 1) * fade
 *
 * so the drums turn out (+) below the setpoint and in (-) above it, at full
 * speed once the power is a band or more away. `fade` drops linearly from 1
 * to 0 over the last LIMIT_TAPER degrees before the limit the drums are
 * moving toward, and is 0 at or beyond it. The law is continuous in power
 * and angle.
 */
class PowerSetpointRule : public ControlRule
{
  private:
    static constexpr real_t LIMIT_TAPER = 1.0; ///< [deg]

    real_t setpoint;
    real_t band;
    real_t speed;
    real_t minAngle;
    real_t maxAngle;

  public:
    /// @throws std::invalid_argument if band <= 0, speed < 0 or minAngle > maxAngle.
    PowerSetpointRule(real_t setpoint_, real_t band_, real_t speed_,
                      real_t minAngle_=0.0, real_t maxAngle_=180.0);

    real_t drumSpeed(real_t t, const State& state) const override;
    json toJson() const override;
};
