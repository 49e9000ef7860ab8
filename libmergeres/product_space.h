#ifndef MERGERES_PRODUCT_SPACE_H
#define MERGERES_PRODUCT_SPACE_H

#include "common.h"
#include "choice_set.h"

namespace mergeres {
	template<class T> class product_space_t;

	/**
	  One dimension of a product space, linked to its neighbours in
	  connection order.
	  */
	template<class T> class chain_node_t
	{
		friend class product_space_t<T>;
	public:
		typedef boost::shared_ptr<const sized_choice_set_t<T> > set_ptr;

		chain_node_t(const set_ptr &choices) :
			choices_(choices), prev_(), next_() {}

		const set_ptr& choices() const { return choices_; }
		double size() const { return choices_->size(); }

		const chain_node_t* prev() const { return prev_; }
		const chain_node_t* next() const { return next_; }

	private:
		void link(chain_node_t *successor)
		{
			DCHECK(!next_ && !successor->prev_);
			next_=successor;
			successor->prev_=this;
		}

		set_ptr choices_;
		chain_node_t *prev_, *next_;
	};

	/**
		Odometer over a chain of choice sets. The first connected node is
		the most significant digit, the last one turns fastest:

		  (A0,B0) (A0,B1) (A0,B2) (A1,B0) (A1,B1) (A1,B2)

		Every iterator owns its own sub-cursors, so several traversals of
		the same space never interfere. next() past the end does nothing
		and returns false.
	  */
	template<class T> class product_iterator_t
	{
	public:
		typedef std::vector<T> combination_t;
		typedef boost::shared_ptr<chain_node_t<T> > node_ptr;
		typedef typename sized_choice_set_t<T>::cursor_ptr cursor_ptr;

		product_iterator_t(const std::vector<node_ptr> &nodes) :
			nodes_(nodes), started_(), exhausted_(nodes.empty())
		{
			for(auto i=nodes_.begin(), iend=nodes_.end(); i!=iend; ++i)
				if ((*i)->size()==0)
					exhausted_=true;
		}

		bool has_next() const
		{
			if (exhausted_)
				return false;
			if (!started_)
				return true;
			for(auto i=cursors_.begin(), iend=cursors_.end(); i!=iend; ++i)
				if ((*i)->has_next())
					return true;
			return false;
		}

		bool next(combination_t *res)
		{
			if (!has_next())
				return false;

			if (!started_)
			{
				started_=true;
				cursors_.reserve(nodes_.size());
				current_.reserve(nodes_.size());
				indices_.assign(nodes_.size(), 0);

				for(auto i=nodes_.begin(), iend=nodes_.end(); i!=iend; ++i)
				{
					cursor_ptr cur=(*i)->choices()->produce();
					if (!cur->has_next())
					{
						//The set lied about its size
						LOG(WARNING) << "Choice set of size " << (*i)->size()
									 << " produced no candidates";
						exhausted_=true;
						current_.clear();
						return false;
					}
					current_.push_back(cur->next());
					cursors_.push_back(cur);
				}
			} else
			{
				//Increment the least significant digit and carry to the
				//left. has_next() guarantees that some digit can move.
				size_t pos=nodes_.size();
				while(pos>0)
				{
					--pos;
					if (cursors_[pos]->has_next())
					{
						current_[pos]=cursors_[pos]->next();
						++indices_[pos];
						break;
					}

					cursors_[pos]=nodes_[pos]->choices()->produce();
					CHECK(cursors_[pos]->has_next())
							<< "Choice set is not restartable";
					current_[pos]=cursors_[pos]->next();
					indices_[pos]=0;
				}
			}

			*res=current_;
			return true;
		}

		//Per-dimension position of the last combination returned
		const std::vector<size_t>& indices() const { return indices_; }

	private:
		std::vector<node_ptr> nodes_;
		std::vector<cursor_ptr> cursors_;
		combination_t current_;
		std::vector<size_t> indices_;
		bool started_, exhausted_;
	};

	/**
		Cartesian product of an arbitrary number of choice sets, enumerated
		lazily. The size is never computed by enumeration and is kept in a
		double: products past 2^53 are approximate.
	  */
	template<class T> class product_space_t
	{
	public:
		typedef chain_node_t<T> node_t;
		typedef typename node_t::set_ptr set_ptr;
		typedef boost::shared_ptr<node_t> node_ptr;
		typedef product_iterator_t<T> iterator_t;

		product_space_t() {}

		node_t& connect(const set_ptr &choices)
		{
			node_ptr node(new node_t(choices));
			if (!nodes_.empty())
				nodes_.back()->link(node.get());
			nodes_.push_back(node);
			return *node;
		}

		size_t dimensions() const { return nodes_.size(); }
		const node_t* head() const
		{
			return nodes_.empty() ? 0 : nodes_.front().get();
		}
		const node_t* tail() const
		{
			return nodes_.empty() ? 0 : nodes_.back().get();
		}

		double size() const
		{
			if (nodes_.empty())
				return 0;

			double res=1;
			for(const node_t *cur=head(); cur; cur=cur->next())
			{
				double sz=cur->size();
				if (sz==0)
					return 0;
				res*=sz;
			}
			return res;
		}

		iterator_t traverse() const
		{
			return iterator_t(nodes_);
		}

		/**
		  Position of the combination with the given per-dimension indices
		  in traversal order.
		  */
		double rank(const std::vector<size_t> &indices) const
		{
			if (nodes_.empty())
				throw std::out_of_range("Empty product space");
			if (indices.size()!=nodes_.size())
				throw std::out_of_range("Wrong number of indices");

			double res=0;
			for(size_t f=0; f<indices.size(); ++f)
			{
				double radix=nodes_[f]->size();
				if (indices[f]>=radix)
					throw std::out_of_range("Index is out of dimension");
				res=res*radix+indices[f];
			}
			return res;
		}

	private:
		product_space_t(const product_space_t&);
		product_space_t& operator = (const product_space_t&);

		std::vector<node_ptr> nodes_;
	};

}; //namespace mergeres

#endif //MERGERES_PRODUCT_SPACE_H
