#pragma once

#include "ooc/core/error.hpp"
#include "ooc/core/macros.hpp"

#include <hdf5.h>

#include <cstdint>
#include <mutex>
#include <string>
#include <type_traits>
#include <vector>

// =============================================================================
// FILE: ooc/io/hdf5.hpp
// BRIEF: RAII HDF5 handles for the dataset metadata file
// =============================================================================

namespace ooc::io::h5 {

namespace detail {

// Map C++ types to HDF5 native types
template <typename T>
inline hid_t native_type() {
    if constexpr (std::is_same_v<T, std::int32_t>)       return H5T_NATIVE_INT32;
    else if constexpr (std::is_same_v<T, std::int64_t>)  return H5T_NATIVE_INT64;
    else if constexpr (std::is_same_v<T, std::uint8_t>)  return H5T_NATIVE_UINT8;
    else if constexpr (std::is_same_v<T, std::uint32_t>) return H5T_NATIVE_UINT32;
    else if constexpr (std::is_same_v<T, std::uint64_t>) return H5T_NATIVE_UINT64;
    else {
        static_assert(!sizeof(T), "Unsupported HDF5 element type");
    }
}

inline void check_h5(herr_t err, const std::string& context) {
    if (err < 0) {
        std::string msg = "HDF5: " + context;

        struct ErrorWalker {
            std::string* msg;
        } walker{&msg};

        herr_t walk_err = H5Ewalk2(H5E_DEFAULT, H5E_WALK_DOWNWARD,
            [](unsigned, const H5E_error2_t* err, void* data) -> herr_t {
                auto* w = static_cast<ErrorWalker*>(data);
                if (err->desc) {
                    *w->msg += "\n  " + std::string(err->desc);
                }
                return 0;
            }, &walker);

        if (walk_err < 0) {
            msg += " (failed to retrieve error details)";
        }

        throw IOError(msg);
    }
}

inline void check_id(hid_t id, const std::string& context) {
    if (id < 0) {
        throw IOError("HDF5 invalid ID: " + context);
    }
}

} // namespace detail

/// The serial HDF5 library is not thread-safe; every call sequence goes
/// through this lock.
inline std::mutex& library_mutex() {
    static std::mutex m;
    return m;
}

/// Turn off HDF5's automatic error stack printing. Failures are reported
/// through exceptions instead.
inline void silence_errors() noexcept {
    static std::once_flag once;
    std::call_once(once, [] { H5Eset_auto2(H5E_DEFAULT, nullptr, nullptr); });
}

// =============================================================================
// Object - Owning hid_t
// =============================================================================

class Object {
protected:
    hid_t _id;
    herr_t (*_closer)(hid_t);

    explicit Object(hid_t id, herr_t (*closer)(hid_t)) noexcept
        : _id(id), _closer(closer) {}

public:
    ~Object() noexcept { close(); }

    void close() noexcept {
        if (is_valid() && _closer) {
            _closer(_id);
            _id = H5I_INVALID_HID;
        }
    }

    Object(Object&& other) noexcept
        : _id(other._id), _closer(other._closer)
    {
        other._id = H5I_INVALID_HID;
        other._closer = nullptr;
    }

    Object& operator=(Object&& other) noexcept {
        if (this != &other) {
            close();
            _id = other._id;
            _closer = other._closer;
            other._id = H5I_INVALID_HID;
            other._closer = nullptr;
        }
        return *this;
    }

    Object(const Object&) = delete;
    Object& operator=(const Object&) = delete;

    OOC_NODISCARD hid_t id() const noexcept { return _id; }

    OOC_NODISCARD bool is_valid() const noexcept {
        return _id >= 0 && _id != H5I_INVALID_HID;
    }
};

// =============================================================================
// Dataspace
// =============================================================================

class Dataspace : public Object {
public:
    explicit Dataspace(hsize_t length)
        : Object(H5Screate_simple(1, &length, nullptr), H5Sclose)
    {
        detail::check_id(_id, "H5Screate_simple");
    }

    explicit Dataspace(hid_t space_id)
        : Object(space_id, H5Sclose) {}

    OOC_NODISCARD hssize_t num_elements() const {
        return H5Sget_simple_extent_npoints(_id);
    }
};

// =============================================================================
// Dataset - One-dimensional
// =============================================================================

class Dataset : public Object {
public:
    Dataset(hid_t loc_id, const std::string& name)
        : Object(H5Dopen2(loc_id, name.c_str(), H5P_DEFAULT), H5Dclose)
    {
        detail::check_id(_id, "H5Dopen: " + name);
    }

    template <typename T>
    static Dataset create(hid_t loc_id, const std::string& name, hsize_t length) {
        Dataspace space(length);
        hid_t id = H5Dcreate2(loc_id, name.c_str(), detail::native_type<T>(), space.id(),
                              H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
        detail::check_id(id, "H5Dcreate: " + name);
        return Dataset(id);
    }

    OOC_NODISCARD hsize_t num_elements() const {
        hid_t space_id = H5Dget_space(_id);
        detail::check_id(space_id, "H5Dget_space");
        Dataspace space(space_id);
        hssize_t n = space.num_elements();
        if (n < 0) {
            throw IOError("HDF5: H5Sget_simple_extent_npoints failed");
        }
        return static_cast<hsize_t>(n);
    }

    template <typename T>
    void write(const T* buffer) {
        detail::check_h5(
            H5Dwrite(_id, detail::native_type<T>(), H5S_ALL, H5S_ALL, H5P_DEFAULT, buffer),
            "H5Dwrite");
    }

    template <typename T>
    std::vector<T> read_vector() const {
        std::vector<T> data(num_elements());
        if (!data.empty()) {
            detail::check_h5(
                H5Dread(_id, detail::native_type<T>(), H5S_ALL, H5S_ALL, H5P_DEFAULT, data.data()),
                "H5Dread");
        }
        return data;
    }

private:
    explicit Dataset(hid_t id) noexcept
        : Object(id, H5Dclose) {}
};

// =============================================================================
// File
// =============================================================================

class File : public Object {
public:
    static File open_read_only(const std::string& path) {
        silence_errors();
        hid_t id = H5Fopen(path.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT);
        detail::check_id(id, "H5Fopen: " + path);
        return File(id);
    }

    /// Create a new file; fails if it already exists.
    static File create(const std::string& path) {
        silence_errors();
        hid_t id = H5Fcreate(path.c_str(), H5F_ACC_EXCL, H5P_DEFAULT, H5P_DEFAULT);
        detail::check_id(id, "H5Fcreate: " + path);
        return File(id);
    }

    OOC_NODISCARD bool exists(const std::string& name) const {
        return H5Lexists(_id, name.c_str(), H5P_DEFAULT) > 0;
    }

    void flush() {
        detail::check_h5(H5Fflush(_id, H5F_SCOPE_GLOBAL), "H5Fflush");
    }

    template <typename T>
    void write_vector(const std::string& name, const std::vector<T>& data) {
        auto ds = Dataset::create<T>(_id, name, static_cast<hsize_t>(data.size()));
        if (!data.empty()) {
            ds.write(data.data());
        }
    }

    template <typename T>
    std::vector<T> read_vector(const std::string& name) const {
        Dataset ds(_id, name);
        return ds.template read_vector<T>();
    }

private:
    explicit File(hid_t id) noexcept
        : Object(id, H5Fclose) {}
};

} // namespace ooc::io::h5
