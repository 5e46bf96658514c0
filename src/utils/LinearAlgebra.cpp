#include <pdekit/utils/LinearAlgebra.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

// ===========================================================================
// Matrix Operations
// ===========================================================================

double MatrixOps::normInf(const std::vector<double> &x)
{
    double maxVal = 0.0;
    for (double xi : x) {
        if (std::isnan(xi))
            return xi;   // propagate NaN so callers see a non-finite norm
        maxVal = std::max(maxVal, std::abs(xi));
    }
    return maxVal;
}

void MatrixOps::axpy(double alpha, const std::vector<double> &x, std::vector<double> &y)
{
    if (x.size() != y.size())
        throw std::invalid_argument("MatrixOps::axpy: dimension mismatch");
    for (size_t i = 0; i < x.size(); ++i)
        y[i] += alpha * x[i];
}

Matrix MatrixOps::zeros(size_t m, size_t n)
{
    return Matrix(m, std::vector<double>(n, 0.0));
}

// ===========================================================================
// QR - Implicit Q via stored Householder vectors
// ===========================================================================

QRResult QR::decompose(const Matrix &A)
{
    size_t m = A.size();
    if (m == 0)
        return {};
    size_t n = A[0].size();
    size_t k = std::min(m, n);

    Matrix R = A;
    std::vector<double> tau(k, 0.0);

    for (size_t j = 0; j < k; ++j)
    {
        double norm = 0.0;
        for (size_t i = j; i < m; ++i)
            norm += R[i][j] * R[i][j];
        norm = std::sqrt(norm);

        if (norm < 1e-15)
            continue;   // column already zero below the diagonal, H_j = I

        double sign = (R[j][j] >= 0) ? 1.0 : -1.0;
        double u1 = R[j][j] + sign * norm;

        // v = [1, R[j+1:, j] / u1], stored below the diagonal
        for (size_t i = j + 1; i < m; ++i)
            R[i][j] /= u1;
        tau[j] = sign * u1 / norm;

        // R[:, c] -= tau * v * (v^T R[:, c]) for the trailing columns
        for (size_t c = j + 1; c < n; ++c)
        {
            double dot = R[j][c];
            for (size_t i = j + 1; i < m; ++i)
                dot += R[i][j] * R[i][c];
            dot *= tau[j];
            R[j][c] -= dot;
            for (size_t i = j + 1; i < m; ++i)
                R[i][c] -= R[i][j] * dot;
        }

        R[j][j] = -sign * norm;
    }

    return {std::move(R), std::move(tau)};
}

std::vector<double> QR::applyQT(const QRResult &qr, const std::vector<double> &b)
{
    // Q^T = H_k * ... * H_1, applied in forward order
    size_t m = b.size();
    std::vector<double> c = b;

    for (size_t j = 0; j < qr.tau.size(); ++j)
    {
        if (qr.tau[j] == 0.0)
            continue;

        double dot = c[j];
        for (size_t i = j + 1; i < m; ++i)
            dot += qr.R[i][j] * c[i];
        dot *= qr.tau[j];

        c[j] -= dot;
        for (size_t i = j + 1; i < m; ++i)
            c[i] -= qr.R[i][j] * dot;
    }
    return c;
}

std::vector<double> QR::solve(const QRResult &qr, const std::vector<double> &b)
{
    if (qr.R.empty())
        throw std::invalid_argument("QR::solve: empty decomposition");
    if (b.size() != qr.R.size())
        throw std::invalid_argument("QR::solve: dimension mismatch");
    return solveR(qr.R, applyQT(qr, b));
}

std::vector<double> QR::solveR(const Matrix &R, const std::vector<double> &c)
{
    size_t n = std::min(R.size(), R[0].size());
    std::vector<double> x(n);

    // relative tolerance based on the largest diagonal entry
    double Rnorm = 0.0;
    for (size_t i = 0; i < n; ++i)
        Rnorm = std::max(Rnorm, std::abs(R[i][i]));
    double tol = 1e-14 * Rnorm;

    for (size_t ii = n; ii-- > 0;)
    {
        double sum = c[ii];
        for (size_t j = ii + 1; j < n; ++j)
            sum -= R[ii][j] * x[j];

        if (std::abs(R[ii][ii]) <= tol)
            throw std::runtime_error("QR::solveR: R is singular at diagonal " + std::to_string(ii));
        x[ii] = sum / R[ii][ii];
    }
    return x;
}
