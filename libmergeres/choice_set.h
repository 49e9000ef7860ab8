#ifndef MERGERES_CHOICE_SET_H
#define MERGERES_CHOICE_SET_H

#include "common.h"

namespace mergeres {

	/**
	  Forward-only cursor over the candidates of one choice set.
	  */
	template<class T> class choice_cursor_t
	{
	public:
		virtual ~choice_cursor_t() {}

		virtual bool has_next() const = 0;
		//Must be guarded by has_next()
		virtual T next() = 0;
	};

	/**
		One dimension of a resolution space: a finite, ordered collection
		of candidates that knows its own cardinality.

		produce() must return a fresh cursor at the first candidate every
		time it's called and the candidates must come out in the same order
		on every call, so that an index into the sequence identifies one
		specific choice.

		size() is a double so that products of many sets never overflow.
		Beyond 2^53 the value is no longer exact.
	  */
	template<class T> class sized_choice_set_t
	{
	public:
		typedef T value_type;
		typedef boost::shared_ptr<choice_cursor_t<T> > cursor_ptr;

		virtual ~sized_choice_set_t() {}

		virtual double size() const = 0;
		virtual cursor_ptr produce() const = 0;
	};

	template<class T> class vector_choice_set_t : public sized_choice_set_t<T>
	{
		typedef std::vector<T> values_t;

		//Cursors share ownership of the values, so a cursor stays valid
		//after its set is gone
		class cursor : public choice_cursor_t<T>
		{
			boost::shared_ptr<const values_t> values_;
			typename values_t::const_iterator pos_;
		public:
			cursor(const boost::shared_ptr<const values_t> &values) :
				values_(values), pos_(values->begin()) {}

			virtual bool has_next() const
			{
				return pos_!=values_->end();
			}

			virtual T next()
			{
				DCHECK(pos_!=values_->end());
				return *pos_++;
			}
		};

		boost::shared_ptr<const values_t> values_;
	public:
		typedef typename sized_choice_set_t<T>::cursor_ptr cursor_ptr;

		vector_choice_set_t(std::vector<T> &&values) :
			values_(new values_t(std::move(values))) {}
		vector_choice_set_t(const std::vector<T> &values) :
			values_(new values_t(values)) {}

		virtual double size() const
		{
			return static_cast<double>(values_->size());
		}

		virtual cursor_ptr produce() const
		{
			return cursor_ptr(new cursor(values_));
		}

		const std::vector<T>& values() const { return *values_; }
	};

}; //namespace mergeres

#endif //MERGERES_CHOICE_SET_H
