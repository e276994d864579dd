#if !defined(REFCOUNT_H)
#define REFCOUNT_H
/*
 * Reference counting with delete on last release.
 *
 * Grammar elements and Errors are immutable values that share a counted Body,
 * so copying a Sequence, an Alternatives group or an Error never copies its contents.
 *
 * (c) Copyright Clifford Heath 2025. See LICENSE file for usage rights.
 */
#include	<atomic>

class	RefCounted
{
public:
	virtual		~RefCounted() { }
			RefCounted() : ref_count(0) {}
	void		AddRef() const { (void)ref_count++; }
	void		Release() const { if (--ref_count == 0) delete this; }
			// Only for debugging, may be instantly stale unless == 1:
	int		GetRefCount() const { return (int)ref_count; }

protected:
	mutable std::atomic<int>	ref_count;
};

template <class T>
class Ref
{
	std::atomic<T*>	ptr;

public:
			~Ref() { T* o = ptr; if (o) o->Release(); }
			Ref() : ptr(0) {}
			Ref(T* o) : ptr(o) { if (o) o->AddRef(); }
			Ref(const Ref& other) : ptr(0) { T* o = other; if (o) o->AddRef(); ptr = o; }
	Ref&		operator=(const Ref& other)
			{
				T*      o = other;
				if (o)
					o->AddRef();
				o = (T*)ptr.exchange(o);
				if (o)
					o->Release();
				return *this;
			}
	Ref&		operator=(T* other)
			{
				if (other)
					other->AddRef();

				T*      o = (T*)ptr.exchange(other);
				if (o)
					o->Release();
				return *this;
			}

			operator T*() const { return ptr; }
	T*		operator->() const { return ptr; }
	T&		operator*() const { return *ptr; }

	bool		same(const Ref& other) const	// Do both refer to the same object?
			{ return (T*)ptr == (T*)other.ptr; }
	int		GetRefCount() const
			{	// If the value is > 1 another thread might change it before we use it
				T*      o = (T*)ptr;
				return o ? o->GetRefCount() : 0;
			}
};
#endif
