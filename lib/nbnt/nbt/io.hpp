/* This file is part of NBNT project.
 * Copyright (c) 2025 NBNT contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef NBNT_NBT_IO_HPP
#define NBNT_NBT_IO_HPP

#include <bit>
#include <cstdint>
#include <istream>
#include <ostream>
#include <nbnt/common/bytes.hpp>

namespace nbnt::nbt {
    // Sequential big-endian reader. Reading past the end raises incomplete_error.
    struct data_input {
        virtual ~data_input() =default;

        void read_fully(const write_buffer out)
        {
            if (!out.empty()) {
                _read_impl(out);
                _consumed += out.size();
            }
        }

        void skip(const size_t num_bytes)
        {
            if (num_bytes) {
                _skip_impl(num_bytes);
                _consumed += num_bytes;
            }
        }

        uint8_t read_unsigned_byte()
        {
            return _read_be<uint8_t>();
        }

        int8_t read_byte()
        {
            return static_cast<int8_t>(_read_be<uint8_t>());
        }

        int16_t read_short()
        {
            return static_cast<int16_t>(_read_be<uint16_t>());
        }

        uint16_t read_unsigned_short()
        {
            return _read_be<uint16_t>();
        }

        int32_t read_int()
        {
            return static_cast<int32_t>(_read_be<uint32_t>());
        }

        int64_t read_long()
        {
            return static_cast<int64_t>(_read_be<uint64_t>());
        }

        float read_float()
        {
            return std::bit_cast<float>(_read_be<uint32_t>());
        }

        double read_double()
        {
            return std::bit_cast<double>(_read_be<uint64_t>());
        }

        // the number of bytes read or skipped so far
        uint64_t consumed() const noexcept
        {
            return _consumed;
        }
    protected:
        virtual void _read_impl(write_buffer out) =0;
        virtual void _skip_impl(size_t num_bytes) =0;
    private:
        uint64_t _consumed = 0;

        template<typename T>
        T _read_be()
        {
            T val;
            read_fully(write_buffer { reinterpret_cast<uint8_t *>(&val), sizeof(val) });
            return net_to_host(val);
        }
    };

    struct buffer_input: data_input {
        explicit buffer_input(const buffer bytes):
            _bytes { bytes }
        {
        }

        size_t remaining() const noexcept
        {
            return _bytes.size() - _offset;
        }

        bool eof() const noexcept
        {
            return remaining() == 0;
        }
    protected:
        void _read_impl(write_buffer out) override;
        void _skip_impl(size_t num_bytes) override;
    private:
        buffer _bytes;
        size_t _offset = 0;
    };

    struct stream_input: data_input {
        explicit stream_input(std::istream &is):
            _is { is }
        {
        }
    protected:
        void _read_impl(write_buffer out) override;
        void _skip_impl(size_t num_bytes) override;
    private:
        std::istream &_is;
    };

    // Sequential big-endian writer.
    struct data_output {
        virtual ~data_output() =default;

        void write(const buffer bytes)
        {
            if (!bytes.empty())
                _write_impl(bytes);
        }

        void write_byte(const int8_t v)
        {
            _write_be(static_cast<uint8_t>(v));
        }

        void write_unsigned_byte(const uint8_t v)
        {
            _write_be(v);
        }

        void write_short(const int16_t v)
        {
            _write_be(static_cast<uint16_t>(v));
        }

        void write_unsigned_short(const uint16_t v)
        {
            _write_be(v);
        }

        void write_int(const int32_t v)
        {
            _write_be(static_cast<uint32_t>(v));
        }

        void write_long(const int64_t v)
        {
            _write_be(static_cast<uint64_t>(v));
        }

        void write_float(const float v)
        {
            _write_be(std::bit_cast<uint32_t>(v));
        }

        void write_double(const double v)
        {
            _write_be(std::bit_cast<uint64_t>(v));
        }
    protected:
        virtual void _write_impl(buffer bytes) =0;
    private:
        template<typename T>
        void _write_be(const T v)
        {
            const T net = host_to_net(v);
            _write_impl(buffer::from(net));
        }
    };

    struct vector_output: data_output {
        const uint8_vector &bytes() const noexcept
        {
            return _bytes;
        }

        uint8_vector take() noexcept
        {
            return std::move(_bytes);
        }
    protected:
        void _write_impl(const buffer bytes) override
        {
            _bytes << bytes;
        }
    private:
        uint8_vector _bytes {};
    };

    struct stream_output: data_output {
        explicit stream_output(std::ostream &os):
            _os { os }
        {
        }
    protected:
        void _write_impl(buffer bytes) override;
    private:
        std::ostream &_os;
    };
}

#endif // !NBNT_NBT_IO_HPP
