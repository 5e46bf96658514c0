#include <pdekit/utils/InterpolationSchemes.h>
#include <algorithm>
#include <stdexcept>
#include <string>

// ============================================================================
// InterpolationScheme Base Class Implementation
// ============================================================================
InterpolationScheme::InterpolationScheme(std::vector<double> xData, std::vector<double> yData,
                                         ExtrapolationType extraType)
    : _xData(std::move(xData)), _yData(std::move(yData)), _extrapolationType(extraType)
{
    validateData();

    // Initialised by the derived constructor once its own setup is complete
    switch (extraType) {
        case ExtrapolationType::Flat:
            _extrapolationScheme = std::make_unique<FlatExtrapolation>();
            break;
        case ExtrapolationType::Linear:
            _extrapolationScheme = std::make_unique<LinearExtrapolation>();
            break;
        case ExtrapolationType::None:
            _extrapolationScheme = std::make_unique<NoExtrapolation>();
            break;
    }
}

InterpolationScheme::~InterpolationScheme() = default;

void InterpolationScheme::validateData() const
{
    if (_xData.size() != _yData.size()) {
        throw std::invalid_argument("InterpolationScheme: xData and yData must have same size");
    }
    if (_xData.size() < 2) {
        throw std::invalid_argument("InterpolationScheme: At least 2 data points required");
    }
    auto bad = std::adjacent_find(_xData.begin(), _xData.end(),
                                  [](double a, double b) { return !(a < b); });
    if (bad != _xData.end()) {
        throw std::invalid_argument("InterpolationScheme: xData must be strictly increasing");
    }
}

std::pair<double, double> InterpolationScheme::getRange() const
{
    return {_xData.front(), _xData.back()};
}

size_t InterpolationScheme::findInterval(double x) const
{
    auto it = std::upper_bound(_xData.begin(), _xData.end(), x);
    if (it == _xData.begin()) {
        return 0;
    }
    size_t idx = static_cast<size_t>(std::distance(_xData.begin(), it)) - 1;
    return std::min(idx, _xData.size() - 2);
}

double InterpolationScheme::operator()(double x) const
{
    auto [xMin, xMax] = getRange();
    if (x < xMin || x > xMax) {
        return _extrapolationScheme->extrapolate(x, *this);
    }
    return interpolate(x);
}

// ============================================================================
// LinearInterpolation Implementation
// ============================================================================

LinearInterpolation::LinearInterpolation(std::vector<double> xData, std::vector<double> yData,
                                         ExtrapolationType extraType)
    : InterpolationScheme(std::move(xData), std::move(yData), extraType)
{
    _extrapolationScheme->initialize(*this);
}

double LinearInterpolation::interpolate(double x) const
{
    size_t idx = findInterval(x);
    double x0 = _xData[idx];
    double x1 = _xData[idx + 1];
    double y0 = _yData[idx];
    double y1 = _yData[idx + 1];
    return y0 + (y1 - y0) * (x - x0) / (x1 - x0);
}

double LinearInterpolation::derivative(double x) const
{
    size_t idx = findInterval(x);
    return (_yData[idx + 1] - _yData[idx]) / (_xData[idx + 1] - _xData[idx]);
}

std::unique_ptr<InterpolationScheme> LinearInterpolation::clone() const
{
    return std::make_unique<LinearInterpolation>(_xData, _yData, _extrapolationType);
}

// ============================================================================
// Extrapolation Schemes
// ============================================================================

std::unique_ptr<ExtrapolationScheme> FlatExtrapolation::clone() const
{
    return std::make_unique<FlatExtrapolation>(*this);
}

void FlatExtrapolation::initialize(const InterpolationScheme& interp)
{
    auto [xMin, xMax] = interp.getRange();
    _yMin = interp.interpolate(xMin);
    _yMax = interp.interpolate(xMax);
}

double FlatExtrapolation::extrapolate(double x, const InterpolationScheme& interp) const
{
    auto [xMin, xMax] = interp.getRange();
    return (x < xMin) ? _yMin : _yMax;
}

std::unique_ptr<ExtrapolationScheme> LinearExtrapolation::clone() const
{
    return std::make_unique<LinearExtrapolation>(*this);
}

void LinearExtrapolation::initialize(const InterpolationScheme& interp)
{
    auto [xMin, xMax] = interp.getRange();
    _yMin = interp.interpolate(xMin);
    _yMax = interp.interpolate(xMax);
    _dyMin = interp.derivative(xMin);
    _dyMax = interp.derivative(xMax);
}

double LinearExtrapolation::extrapolate(double x, const InterpolationScheme& interp) const
{
    auto [xMin, xMax] = interp.getRange();
    if (x < xMin) {
        return _yMin + _dyMin * (x - xMin);
    }
    return _yMax + _dyMax * (x - xMax);
}

std::unique_ptr<ExtrapolationScheme> NoExtrapolation::clone() const
{
    return std::make_unique<NoExtrapolation>();
}

double NoExtrapolation::extrapolate(double x, const InterpolationScheme& interp) const
{
    auto [xMin, xMax] = interp.getRange();
    throw std::out_of_range("interpolation at " + std::to_string(x) + " outside the data range ["
                            + std::to_string(xMin) + ", " + std::to_string(xMax) + "]");
}
