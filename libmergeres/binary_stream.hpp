#ifndef BINARY_STREAM_HPP
#define BINARY_STREAM_HPP

#include "common.h"
#include <netinet/in.h>
#include <algorithm>
#include <boost/cast.hpp>

namespace utils {

	class output_stream
	{
		void write_byte_0(uint8_t ch)
		{
			write(&ch, 1);
		}
		void write_int4_0(uint32_t val)
		{
			uint32_t msb = htonl(val);
			write(&msb, 4);
		}

	public:
		virtual ~output_stream() {};
		virtual void write(const void *data, size_t bytes)=0;

		template<class T> void write_byte(T ch)
		{
			write_byte_0(boost::numeric_cast<uint8_t>(ch));
		}

		template<class T> void write_uint4(T ch)
		{
			write_int4_0(boost::numeric_cast<uint32_t>(ch));
		}

		//Length-prefixed
		void write_str(const std::string &str)
		{
			write_uint4(str.size());
			write(str.data(), str.size());
		}
	};

	class string_stream : public output_stream
	{
	public:
		std::string buffer;
		void write(const void *data, size_t bytes)
		{
			buffer.append(static_cast<const char*>(data), bytes);
		}
	};

	class input_stream
	{
	public:
		virtual ~input_stream() {};
		virtual void read(void *data, size_t bytes)=0;
		virtual size_t remaining() const=0;

		uint8_t read_byte()
		{
			uint8_t res;
			read(&res, 1);
			return res;
		}

		uint32_t read_uint4()
		{
			uint32_t res;
			read(&res, 4);
			return ntohl(res);
		}

		std::string read_str()
		{
			uint32_t len=read_uint4();
			if (len>remaining())
				throw std::out_of_range("String is longer than the buffer");
			std::string res;
			res.resize(len);
			if (len)
				read(&res[0], len);
			return res;
		}
	};

	class string_input_stream : public input_stream
	{
		const std::string &buffer_;
		size_t pos_;
	public:
		string_input_stream(const std::string &buffer) :
			buffer_(buffer), pos_() {}

		void read(void *data, size_t bytes)
		{
			if (remaining() < bytes)
				throw std::out_of_range("Premature end of buffer");

			std::copy(buffer_.begin()+pos_, buffer_.begin()+pos_+bytes,
					  static_cast<char*>(data));
			pos_ += bytes;
		}

		size_t remaining() const
		{
			return buffer_.size()-pos_;
		}
	};

}  // namespace utils

#endif  //BINARY_STREAM_HPP
