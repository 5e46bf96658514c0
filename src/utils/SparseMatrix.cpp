#include <pdekit/utils/SparseMatrix.h>
#include <algorithm>
#include <stdexcept>
#include <string>

SparseMatrix::SparseMatrix(size_t rows, size_t cols, const std::vector<Triplet>& triplets)
    : _rows(rows), _cols(cols), _rowPtr(rows + 1, 0)
{
    std::vector<Triplet> sorted = triplets;
    for (const Triplet& t : sorted) {
        if (t.row >= rows || t.col >= cols) {
            throw std::out_of_range("SparseMatrix: triplet (" + std::to_string(t.row) + ", "
                                    + std::to_string(t.col) + ") outside "
                                    + std::to_string(rows) + "x" + std::to_string(cols));
        }
    }
    std::sort(sorted.begin(), sorted.end(), [](const Triplet& a, const Triplet& b) {
        return a.row < b.row || (a.row == b.row && a.col < b.col);
    });

    // Merge duplicates while filling CSR arrays
    for (size_t k = 0; k < sorted.size(); ++k) {
        const Triplet& t = sorted[k];
        bool duplicate = !_colIdx.empty() && k > 0
                         && sorted[k - 1].row == t.row && sorted[k - 1].col == t.col;
        if (duplicate) {
            _values.back() += t.value;
            continue;
        }
        _colIdx.push_back(t.col);
        _values.push_back(t.value);
        _rowPtr[t.row + 1]++;
    }
    for (size_t i = 0; i < rows; ++i) {
        _rowPtr[i + 1] += _rowPtr[i];
    }
}

std::vector<double> SparseMatrix::multiply(const std::vector<double>& x) const
{
    if (x.size() != _cols) {
        throw std::invalid_argument("SparseMatrix::multiply: expected vector of size "
                                    + std::to_string(_cols) + ", got " + std::to_string(x.size()));
    }
    std::vector<double> y(_rows, 0.0);
    for (size_t i = 0; i < _rows; ++i) {
        double sum = 0.0;
        for (size_t k = _rowPtr[i]; k < _rowPtr[i + 1]; ++k)
            sum += _values[k] * x[_colIdx[k]];
        y[i] = sum;
    }
    return y;
}

double SparseMatrix::coeff(size_t i, size_t j) const
{
    if (i >= _rows || j >= _cols) {
        throw std::out_of_range("SparseMatrix::coeff: index out of range");
    }
    for (size_t k = _rowPtr[i]; k < _rowPtr[i + 1]; ++k) {
        if (_colIdx[k] == j)
            return _values[k];
    }
    return 0.0;
}

Matrix SparseMatrix::toDense() const
{
    Matrix A = MatrixOps::zeros(_rows, _cols);
    for (size_t i = 0; i < _rows; ++i)
        for (size_t k = _rowPtr[i]; k < _rowPtr[i + 1]; ++k)
            A[i][_colIdx[k]] = _values[k];
    return A;
}
