#include <cstdlib>
#include <cstring>
#include <compgroup/containers/column.hpp>

namespace compgroup
{
    namespace
    {
        void* allocate(const std::size_t bytes)
        {
            void* p = std::malloc(std::max<std::size_t>(bytes, 1));
            if (!p)
                throw std::bad_alloc();
            return p;
        }

        /* copies every constructed row of `src` into the uninitialized `dst` */
        void copy_rows(void* dst, const void* src, const ColumnLayout& shape,
                       const std::size_t rows, const std::vector<bool>& constructed)
        {
            if (!shape.copier)
            {
                std::memcpy(dst, src, shape.size * rows);
                return;
            }

            for (std::size_t i = 0; i < rows && i < constructed.size(); ++i)
            {
                if (constructed[i])
                {
                    shape.copier(static_cast<char*>(dst) + (i * shape.size),
                                 static_cast<const char*>(src) + (i * shape.size));
                }
            }
        }
    }

    Column::Column(const ColumnLayout& layout) : shape(layout) {}

    Column::~Column()
    {
        clear();
    }

    Column::Column(const Column &other) :
        cap(other.cap), shape(other.shape), constructed(other.constructed)
    {
        if (other.ptr && other.cap > 0)
        {
            ptr = allocate(other.cap * shape.size);
            copy_rows(ptr, other.ptr, shape, cap, constructed);
        }
    }

    Column::Column(Column &&other) noexcept :
        ptr(other.ptr), cap(other.cap), shape(other.shape),
        constructed(std::move(other.constructed))
    {
        other.ptr = nullptr;
        other.cap = 0;
        other.constructed.clear();
    }

    Column& Column::operator=(const Column &other)
    {
        if (this != &other)
        {
            clear();

            shape = other.shape;
            cap = other.cap;
            constructed = other.constructed;

            if (other.ptr && other.cap > 0)
            {
                ptr = allocate(other.cap * shape.size);
                copy_rows(ptr, other.ptr, shape, cap, constructed);
            }
        }
        return *this;
    }

    Column& Column::operator=(Column &&other) noexcept
    {
        if (this != &other)
        {
            clear();

            ptr = other.ptr;
            cap = other.cap;
            shape = other.shape;
            constructed = std::move(other.constructed);

            other.ptr = nullptr;
            other.cap = 0;
            other.constructed.clear();
        }
        return *this;
    }

    void Column::resize(const std::size_t new_cap)
    {
        if (new_cap <= cap)
            return;

        void* new_ptr = allocate(shape.size * new_cap);

        /* copy data first, then update ptr, then clean up old memory */
        if (ptr && cap > 0)
        {
            copy_rows(new_ptr, ptr, shape, cap, constructed);

            void* old_ptr = ptr;
            ptr = new_ptr;

            if (shape.dtor)
            {
                for (std::size_t i = 0; i < cap && i < constructed.size(); ++i)
                {
                    if (constructed[i])
                        shape.dtor(static_cast<char*>(old_ptr) + (i * shape.size));
                }
            }

            std::free(old_ptr);
        }
        else
        {
            std::free(ptr);
            ptr = new_ptr;
        }

        cap = new_cap;
        if (constructed.size() < new_cap)
            constructed.resize(new_cap, false);
    }

    void Column::clear()
    {
        if (ptr && shape.dtor)
        {
            for (std::size_t i = 0; i < cap && i < constructed.size(); ++i)
            {
                if (constructed[i])
                    shape.dtor(static_cast<char*>(ptr) + (i * shape.size));
            }
        }

        std::free(ptr);
        ptr = nullptr;
        cap = 0;
        constructed.clear();
    }

    void* Column::get(const std::size_t row) const
    {
        if (row >= cap || !ptr || !is_constructed(row))
            return nullptr;
        return static_cast<char*>(ptr) + (row * shape.size);
    }

    void Column::destroy_at(const std::size_t row)
    {
        if (!is_constructed(row))
            return;

        if (shape.dtor)
            shape.dtor(static_cast<char*>(ptr) + (row * shape.size));
        constructed[row] = false;
    }

    void Column::copy_from(const std::size_t row, const Column &src, const std::size_t src_row)
    {
        const void* src_ptr = src.get(src_row);
        if (!src_ptr)
            return;

        if (row >= cap)
            resize(std::max(cap * 2, row + 1));

        destroy_at(row);
        void* dst_ptr = static_cast<char*>(ptr) + (row * shape.size);
        if (shape.copier)
            shape.copier(dst_ptr, src_ptr);
        else /* trivial types */
            std::memcpy(dst_ptr, src_ptr, shape.size);
        constructed[row] = true;
    }

    void Column::relocate(const std::size_t dst_row, const std::size_t src_row)
    {
        if (dst_row == src_row)
            return;

        destroy_at(dst_row);
        if (!is_constructed(src_row))
            return;

        void* dst_ptr = static_cast<char*>(ptr) + (dst_row * shape.size);
        const void* src_ptr = static_cast<char*>(ptr) + (src_row * shape.size);
        if (shape.copier)
            shape.copier(dst_ptr, src_ptr);
        else
            std::memcpy(dst_ptr, src_ptr, shape.size);

        constructed[dst_row] = true;
        destroy_at(src_row);
    }

    std::size_t Column::capacity() const
    {
        return cap;
    }

    std::size_t Column::size() const
    {
        return shape.size;
    }

    bool Column::has_dtor() const
    {
        return shape.dtor != nullptr;
    }

    bool Column::has_copier() const
    {
        return shape.copier != nullptr;
    }

    bool Column::is_constructed(const std::size_t row) const
    {
        return row < constructed.size() && constructed[row];
    }
}
