#ifndef PDEKIT_SPARSEMATRIX_H
#define PDEKIT_SPARSEMATRIX_H

#include <pdekit/utils/LinearAlgebra.h>
#include <cstddef>
#include <vector>

/**
 * @class SparseMatrix
 * @brief Compressed sparse row (CSR) matrix used for discrete spatial operators
 *
 * Built once from (row, col, value) triplets, then read-only.
 * Duplicate triplets are summed.
 */
class SparseMatrix
{
public:
    struct Triplet {
        size_t row;
        size_t col;
        double value;
    };

    SparseMatrix() = default;
    SparseMatrix(size_t rows, size_t cols, const std::vector<Triplet>& triplets);

    size_t rows() const { return _rows; }
    size_t cols() const { return _cols; }
    size_t nonZeros() const { return _values.size(); }

    // y = A * x
    std::vector<double> multiply(const std::vector<double>& x) const;

    // Entry (i, j), zero when not stored
    double coeff(size_t i, size_t j) const;

    Matrix toDense() const;

private:
    size_t _rows = 0;
    size_t _cols = 0;
    std::vector<size_t> _rowPtr;   // size rows + 1
    std::vector<size_t> _colIdx;
    std::vector<double> _values;
};

#endif // PDEKIT_SPARSEMATRIX_H
