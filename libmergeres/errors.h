#ifndef MERGERES_ERRORS_H
#define MERGERES_ERRORS_H

#include "common.h"
#include <sstream>
#include <exception>
#include <boost/exception/all.hpp>
#include <boost/throw_exception.hpp>

namespace mergeres {
	class die_t {};
	extern MERGERES_PUBLIC const die_t die;

	class result_code_t
	{
	public:
		enum code_e {
			sOk = 200,
			sBadRequest = 400,
			sNotFound = 404,
			sError = 500,
			sIoError = 503,
		};

		result_code_t() : code_(sOk), desc_()
		{
		}

		result_code_t(code_e code, const std::string &desc="None") :
			code_(code), desc_(desc)
		{

		}

		virtual ~result_code_t(){}

		code_e code() const { return code_; }
		const std::string& desc() const { return desc_; }
		bool ok() const {return code_==sOk;}
	private:
		code_e code_;
		std::string desc_;
	};
	extern MERGERES_PUBLIC const result_code_t sok;

	class mergeres_exception : public virtual boost::exception,
			public std::exception
	{
		const result_code_t code_;
		std::string what_;
	public:
		MERGERES_PUBLIC mergeres_exception(const result_code_t &code);
		virtual ~mergeres_exception() throw() {}

		const result_code_t & err() const
		{
			return code_;
		}

		virtual const char* what() const throw()
		{
			return what_.c_str();
		}
	};

	/**
	  Usage - err(sNotFound) << "This is a description"
	  */
	class err
	{
	public:
		err(result_code_t::code_e code) : code_(code) {}

		//The message is complete only once the temporary dies
		~err() noexcept(false)
		{
			if (code_!=result_code_t::sOk && !std::uncaught_exception())
			{
				boost::throw_exception(mergeres_exception(
										   result_code_t(code_, str_.str())));
			}
		}

		template<class T> err& operator << (const T &val)
		{
			str_ << val;
			return *this;
		}

		err& operator << (std::ostream& (*manip)(std::ostream&))
		{
			manip(str_);
			return *this;
		}

	private:
		err(const err&);
		err& operator = (const err&);

		result_code_t::code_e code_;
		std::stringstream str_;
	};

	inline void operator | (const result_code_t &code, const die_t &)
	{
		if (!code.ok())
			boost::throw_exception(mergeres_exception(code));
	}

#define TRYIT(expr) try{ expr; } catch(const mergeres_exception &ex) { \
		return ex.err(); \
	}

}; //namespace mergeres

#endif //MERGERES_ERRORS_H
