#ifndef PDEKIT_INTERPOLATIONSCHEMES_H
#define PDEKIT_INTERPOLATIONSCHEMES_H

#include <memory>
#include <utility>
#include <vector>

/**
 * Interpolation of sampled data y(x), used to query solutions between
 * stored times and between mesh nodes.
 *
 * The extrapolation type decides what happens outside [x_0, x_{n-1}]:
 *   - Flat:   boundary value
 *   - Linear: boundary value + boundary slope * distance
 *   - None:   std::out_of_range
 */
enum class ExtrapolationType { Flat, Linear, None };

class ExtrapolationScheme;

// ============================================================================
// BASE CLASS: InterpolationScheme
// ============================================================================
class InterpolationScheme
{
public:
    InterpolationScheme(std::vector<double> xData, std::vector<double> yData,
                        ExtrapolationType extraType = ExtrapolationType::None);
    virtual ~InterpolationScheme();

    virtual double interpolate(double x) const = 0;
    virtual double derivative(double x) const = 0;
    virtual std::unique_ptr<InterpolationScheme> clone() const = 0;

    double operator()(double x) const;   // routes to interpolate or extrapolate
    std::pair<double, double> getRange() const;
    ExtrapolationType extrapolationType() const { return _extrapolationType; }

protected:
    std::vector<double> _xData;
    std::vector<double> _yData;
    std::unique_ptr<ExtrapolationScheme> _extrapolationScheme;
    ExtrapolationType _extrapolationType;

    void validateData() const;
    size_t findInterval(double x) const;   // i such that x in [x_i, x_{i+1}), clamped
};

/**
 * Linear interpolation: y = y0 + (y1-y0) * (x-x0) / (x1-x0)
 */
class LinearInterpolation : public InterpolationScheme
{
public:
    LinearInterpolation(std::vector<double> xData, std::vector<double> yData,
                        ExtrapolationType extraType = ExtrapolationType::None);

    double interpolate(double x) const override;
    double derivative(double x) const override;   // slope of the enclosing interval
    std::unique_ptr<InterpolationScheme> clone() const override;
};

// ============================================================================
// BASE CLASS: ExtrapolationScheme
// ============================================================================
class ExtrapolationScheme
{
public:
    virtual ~ExtrapolationScheme() = default;
    virtual std::unique_ptr<ExtrapolationScheme> clone() const = 0;
    virtual void initialize(const InterpolationScheme& interp) = 0;
    virtual double extrapolate(double x, const InterpolationScheme& interp) const = 0;
};

class FlatExtrapolation : public ExtrapolationScheme
{
public:
    std::unique_ptr<ExtrapolationScheme> clone() const override;
    void initialize(const InterpolationScheme& interp) override;
    double extrapolate(double x, const InterpolationScheme& interp) const override;

private:
    double _yMin = 0.0;
    double _yMax = 0.0;
};

class LinearExtrapolation : public ExtrapolationScheme
{
public:
    std::unique_ptr<ExtrapolationScheme> clone() const override;
    void initialize(const InterpolationScheme& interp) override;
    double extrapolate(double x, const InterpolationScheme& interp) const override;

private:
    double _yMin = 0.0;
    double _yMax = 0.0;
    double _dyMin = 0.0;
    double _dyMax = 0.0;
};

// Outside the data range is an error
class NoExtrapolation : public ExtrapolationScheme
{
public:
    std::unique_ptr<ExtrapolationScheme> clone() const override;
    void initialize(const InterpolationScheme&) override {}
    double extrapolate(double x, const InterpolationScheme& interp) const override;
};

#endif // PDEKIT_INTERPOLATIONSCHEMES_H
