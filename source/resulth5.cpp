#include <resulth5.h>
#include <h5utils.h>

ResultWriter::ResultWriter(const std::string& results_dir, const std::string& name)
{
    if (!utility::io::ensure_dir(results_dir)) {
        throw std::runtime_error("Cannot create results directory: " + results_dir);
    }
    filename_ = results_dir + "/" + name + ".h5";
    file_id_ = hdf5::create_file(filename_);
}

ResultWriter::~ResultWriter() {
    hdf5::close_file(file_id_);
}

void ResultWriter::write_system(const Lattice& lat, const InteractionMap& interactions) {
    hid_t group_id = hdf5::create_group(file_id_, "/system");
    hdf5::close_group(group_id);

    hdf5::write_matrix(file_id_, "/system/positions", lat.positions());
    hdf5::write_matrix(file_id_, "/system/interactions", interactions.types);
}

void ResultWriter::write_samples(const LocalizationAccumulator& acc) {
    hid_t group_id = hdf5::create_group(file_id_, "/samples");
    hdf5::close_group(group_id);

    hdf5::write_vector(file_id_, "/samples/lx2", acc.samples_lx2());
    hdf5::write_vector(file_id_, "/samples/ly2", acc.samples_ly2());
}

void ResultWriter::write_result(const MobilityResult& result, const LocalizationAccumulator& acc,
                                const ThermalParameters& thermal, unsigned int seed) {
    hid_t group_id = hdf5::create_group(file_id_, "/result");
    hdf5::close_group(group_id);

    hdf5::write_scalar(file_id_, "/result/avg_lx2", result.avg_lx2);
    hdf5::write_scalar(file_id_, "/result/avg_ly2", result.avg_ly2);
    hdf5::write_scalar(file_id_, "/result/mobility_x", result.mobility_x);
    hdf5::write_scalar(file_id_, "/result/mobility_y", result.mobility_y);
    hdf5::write_scalar(file_id_, "/result/mobility_avg", result.mobility_avg);
    hdf5::write_scalar(file_id_, "/result/stderr_lx2", acc.stderr_lx2());
    hdf5::write_scalar(file_id_, "/result/stderr_ly2", acc.stderr_ly2());

    hdf5::write_scalar(file_id_, "/result/temp", thermal.temp);
    hdf5::write_scalar(file_id_, "/result/inverse_htau", thermal.inverse_htau);
    hdf5::write_scalar(file_id_, "/result/is_hole", thermal.is_hole ? 1.0 : 0.0);
    hdf5::write_scalar(file_id_, "/result/realizations", static_cast<double>(acc.count()));
    hdf5::write_scalar(file_id_, "/result/seed", static_cast<double>(seed));
}
