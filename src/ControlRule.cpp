//==============================================================================
// ControlRule.cpp
// Drum speed policies and the JSON factory used by SimulationConfig.
//==============================================================================

#include "ControlRule.hpp"

//------------------------------------------------------------------------------
// Factory: dispatch on "Type".
//------------------------------------------------------------------------------
std::unique_ptr<ControlRule> ControlRule::fromJson(const json& ruleIn)
{
    const std::string type = ruleIn.at("Type").get<std::string>();

    if (type == "Constant")
    {
        return std::make_unique<ConstantSpeedRule>(ruleIn.value("Speed", 0.0));
    }
    else if (type == "Schedule")
    {
        return std::make_unique<ScheduledSpeedRule>(ruleIn.at("Times").get<vec_real>(),
                                                    ruleIn.at("Speeds").get<vec_real>());
    }
    else if (type == "PowerSetpoint")
    {
        return std::make_unique<PowerSetpointRule>(ruleIn.at("Setpoint").get<real_t>(),
                                                   ruleIn.at("Band").get<real_t>(),
                                                   ruleIn.at("Speed").get<real_t>(),
                                                   ruleIn.value("MinAngle", 0.0),
                                                   ruleIn.value("MaxAngle", 180.0));
    }

    throw std::invalid_argument("Unknown control rule type: " + type);
}

//------------------------------------------------------------------------------
// ConstantSpeedRule
//------------------------------------------------------------------------------
ConstantSpeedRule::ConstantSpeedRule(real_t speed_) : speed(speed_) {}

real_t ConstantSpeedRule::drumSpeed(real_t, const State&) const
{
    return speed;
}

json ConstantSpeedRule::toJson() const
{
    return json{{"Type", "Constant"}, {"Speed", speed}};
}

//------------------------------------------------------------------------------
// ScheduledSpeedRule
//------------------------------------------------------------------------------
ScheduledSpeedRule::ScheduledSpeedRule(vec_real times_, vec_real speeds_)
    : times(std::move(times_)), speeds(std::move(speeds_))
{
    if (times.empty() || times.size() != speeds.size())
    {
        throw std::invalid_argument("Drum schedule needs equally many (>0) times and speeds!");
    }
    if (std::adjacent_find(times.begin(), times.end(),
                           [](real_t a, real_t b){ return b <= a; }) != times.end())
    {
        throw std::invalid_argument("Drum schedule times must be strictly increasing!");
    }
}

real_t ScheduledSpeedRule::drumSpeed(real_t t, const State&) const
{
    // First entry strictly greater than t; the active segment is the one before it.
    auto it = std::upper_bound(times.begin(), times.end(), t);
    if (it == times.begin())
    {
        return 0.0;
    }
    return speeds[static_cast<size_t>(std::distance(times.begin(), it)) - 1];
}

json ScheduledSpeedRule::toJson() const
{
    return json{{"Type", "Schedule"}, {"Times", times}, {"Speeds", speeds}};
}

//------------------------------------------------------------------------------
// PowerSetpointRule
//------------------------------------------------------------------------------
PowerSetpointRule::PowerSetpointRule(real_t setpoint_, real_t band_, real_t speed_,
                                     real_t minAngle_, real_t maxAngle_)
    : setpoint(setpoint_), band(band_), speed(speed_), minAngle(minAngle_), maxAngle(maxAngle_)
{
    if (!(band > 0.0) || speed < 0.0 || minAngle > maxAngle)
    {
        throw std::invalid_argument("PowerSetpoint rule needs band > 0, speed >= 0 and MinAngle <= MaxAngle!");
    }
}

real_t PowerSetpointRule::drumSpeed(real_t, const State& state) const
{
    const real_t power = state.getNeutronPopulation();
    const real_t angle = state.getDrumAngle();

    // Full speed at one band or more from the setpoint, linear in between
    const real_t demand = std::clamp((setpoint - power) / band, -1.0, 1.0);

    // Fade out over the last LIMIT_TAPER degrees before the limit ahead
    const real_t room = (demand > 0.0) ? maxAngle - angle : angle - minAngle;
    const real_t fade = std::clamp(room / LIMIT_TAPER, 0.0, 1.0);

    return speed * demand * fade;
}

json PowerSetpointRule::toJson() const
{
    return json{{"Type", "PowerSetpoint"}, {"Setpoint", setpoint}, {"Band", band},
                {"Speed", speed}, {"MinAngle", minAngle}, {"MaxAngle", maxAngle}};
}
