#ifndef PDEKIT_LINEARALGEBRA_H
#define PDEKIT_LINEARALGEBRA_H

#include <cstddef>
#include <vector>

// Matrix = row-major 2D vector
using Matrix = std::vector<std::vector<double>>;

// Basic matrix/vector operations
class MatrixOps
{
public:
    // ||x||_inf
    static double normInf(const std::vector<double> &x);
    // y = alpha * x + y
    static void axpy(double alpha, const std::vector<double> &x, std::vector<double> &y);
    // zero matrix
    static Matrix zeros(size_t m, size_t n);

private:
    MatrixOps() = delete;
};

// QR decomposition via Householder reflections
// Implicit Q storage: Householder vectors in lower triangle of R, scalars in tau
struct QRResult
{
    Matrix R;                  // upper tri + Householder vectors below diagonal
    std::vector<double> tau;   // Householder scalars
};

class QR
{
public:
    static QRResult decompose(const Matrix &A);
    // solve min ||Ax - b||_2 (exact solve for square non-singular A)
    static std::vector<double> solve(const QRResult &qr, const std::vector<double> &b);
    // solve R * x = c (back substitution), throws std::runtime_error if R is singular
    static std::vector<double> solveR(const Matrix &R, const std::vector<double> &c);
    // apply Q^T to vector without forming Q
    static std::vector<double> applyQT(const QRResult &qr, const std::vector<double> &b);

private:
    QR() = delete;
};

#endif // PDEKIT_LINEARALGEBRA_H
