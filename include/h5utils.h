#pragma once

#include <armadillo>
#include <string>
#include <hdf5.h>
#include <hdf5_hl.h>
#include <stdexcept>

namespace hdf5 {

    inline hid_t create_file(const std::string& filename) {
        hid_t file_id = H5Fcreate(filename.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT);
        if (file_id < 0) {
            throw std::runtime_error("Failed to create HDF5 file: " + filename);
        }
        return file_id;
    }

    inline void close_file(hid_t file_id) {
        H5Fclose(file_id);
    }

    inline hid_t create_group(hid_t file_id, const std::string& group_name) {
        hid_t group_id = H5Gcreate2(file_id, group_name.c_str(), H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
        if (group_id < 0) {
            throw std::runtime_error("Failed to create HDF5 group: " + group_name);
        }
        return group_id;
    }

    inline void close_group(hid_t group_id) {
        H5Gclose(group_id);
    }

    inline void write_scalar(hid_t file_id, const std::string& dataset_name, double value) {
        hsize_t dims[1] = {1};
        herr_t status = H5LTmake_dataset_double(file_id, dataset_name.c_str(), 1, dims, &value);
        if (status < 0) {
            throw std::runtime_error("Failed to write scalar " + dataset_name + " to HDF5 file");
        }
    }

    inline void write_vector(hid_t file_id, const std::string& dataset_name, const arma::vec& vector) {
        hsize_t dims[1] = {static_cast<hsize_t>(vector.n_elem)};
        herr_t status = H5LTmake_dataset_double(file_id, dataset_name.c_str(), 1, dims, vector.memptr());
        if (status < 0) {
            throw std::runtime_error("Failed to write vector " + dataset_name + " to HDF5 file");
        }
    }

    inline void write_matrix(hid_t file_id, const std::string& dataset_name, const arma::mat& matrix) {
        hsize_t dims[2] = {static_cast<hsize_t>(matrix.n_rows), static_cast<hsize_t>(matrix.n_cols)};

        // HDF5 is row-major, Armadillo column-major
        arma::mat row_major = matrix.t();

        herr_t status = H5LTmake_dataset_double(file_id, dataset_name.c_str(), 2, dims, row_major.memptr());
        if (status < 0) {
            throw std::runtime_error("Failed to write matrix " + dataset_name + " to HDF5 file");
        }
    }

    inline void write_matrix(hid_t file_id, const std::string& dataset_name, const arma::imat& matrix) {
        hsize_t dims[2] = {static_cast<hsize_t>(matrix.n_rows), static_cast<hsize_t>(matrix.n_cols)};

        arma::Mat<int> row_major = arma::conv_to<arma::Mat<int>>::from(matrix.t());

        herr_t status = H5LTmake_dataset_int(file_id, dataset_name.c_str(), 2, dims, row_major.memptr());
        if (status < 0) {
            throw std::runtime_error("Failed to write matrix " + dataset_name + " to HDF5 file");
        }
    }

    inline double read_scalar(hid_t file_id, const std::string& dataset_name) {
        double value = 0.0;
        if (H5LTread_dataset_double(file_id, dataset_name.c_str(), &value) < 0) {
            throw std::runtime_error("Failed to read scalar " + dataset_name + " from HDF5 file");
        }
        return value;
    }
}
