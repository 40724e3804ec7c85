#include "vkres.hh"
#include "context.hh"
#include <utility>

namespace
{

void destroy(VkDevice dev, VkDescriptorPool pool) { vkDestroyDescriptorPool(dev, pool, nullptr); }
void destroy(VkDevice dev, VkFramebuffer fb) { vkDestroyFramebuffer(dev, fb, nullptr); }
void destroy(VkDevice dev, VkImageView view) { vkDestroyImageView(dev, view, nullptr); }
void destroy(VkDevice dev, VkRenderPass pass) { vkDestroyRenderPass(dev, pass, nullptr); }
void destroy(VkDevice dev, VkSampler sampler) { vkDestroySampler(dev, sampler, nullptr); }
void destroy(VkDevice dev, VkSemaphore sem) { vkDestroySemaphore(dev, sem, nullptr); }

}

template<typename T>
vkres<T>::vkres()
: value(VK_NULL_HANDLE), ctx(nullptr)
{
}

template<typename T>
vkres<T>::vkres(context& ctx, T t)
: value(t), ctx(&ctx)
{
}

template<typename T>
vkres<T>::vkres(vkres<T>&& other)
: value(other.value), ctx(other.ctx)
{
    other.value = VK_NULL_HANDLE;
}

template<typename T>
vkres<T>::~vkres()
{
    reset();
}

template<typename T>
void vkres<T>::reset(T other)
{
    if(ctx && value != VK_NULL_HANDLE && value != other)
    {
        VkDevice logical_device = ctx->get_device().logical_device;
        ctx->at_frame_finish([value=value, logical_device=logical_device](){
            destroy(logical_device, value);
        });
    }
    value = other;
}

template<typename T>
vkres<T>& vkres<T>::operator=(vkres<T>&& other)
{
    reset(other.value);
    ctx = other.ctx;
    other.value = VK_NULL_HANDLE;
    return *this;
}

template<typename T>
const T& vkres<T>::operator*() const
{
    return value;
}

template<typename T>
vkres<T>::operator T() const
{
    return value;
}

vkres<VkCommandBuffer>::vkres()
: value(VK_NULL_HANDLE), pool(VK_NULL_HANDLE), ctx(nullptr)
{
}

vkres<VkCommandBuffer>::vkres(context& ctx, VkCommandPool pool, VkCommandBuffer buf)
: value(buf), pool(pool), ctx(&ctx)
{
}

vkres<VkCommandBuffer>::vkres(vkres<VkCommandBuffer>&& other)
: value(other.value), pool(other.pool), ctx(other.ctx)
{
    other.value = VK_NULL_HANDLE;
}

vkres<VkCommandBuffer>::~vkres()
{
    reset();
}

void vkres<VkCommandBuffer>::reset(VkCommandBuffer other)
{
    if(pool != VK_NULL_HANDLE && ctx && value != VK_NULL_HANDLE && value != other)
    {
        VkDevice logical_device = ctx->get_device().logical_device;
        ctx->at_frame_finish([value=value, pool=pool, logical_device=logical_device](){
            vkFreeCommandBuffers(logical_device, pool, 1, &value);
        });
    }
    value = other;
}

vkres<VkCommandBuffer>& vkres<VkCommandBuffer>::operator=(vkres<VkCommandBuffer>&& other)
{
    reset(other.value);
    ctx = other.ctx;
    pool = other.pool;
    other.value = VK_NULL_HANDLE;
    return *this;
}

const VkCommandBuffer& vkres<VkCommandBuffer>::operator*() const
{
    return value;
}

vkres<VkCommandBuffer>::operator VkCommandBuffer() const
{
    return value;
}

vkres<VkBuffer>::vkres()
: buffer(VK_NULL_HANDLE), allocation(VK_NULL_HANDLE), ctx(nullptr)
{
}

vkres<VkBuffer>::vkres(context& ctx, VkBuffer buf, VmaAllocation alloc)
: buffer(buf), allocation(alloc), ctx(&ctx)
{
}

vkres<VkBuffer>::vkres(vkres<VkBuffer>&& other)
: buffer(other.buffer), allocation(other.allocation), ctx(other.ctx)
{
    other.buffer = VK_NULL_HANDLE;
    other.allocation = VK_NULL_HANDLE;
}

vkres<VkBuffer>::~vkres()
{
    reset();
}

void vkres<VkBuffer>::reset(VkBuffer buf, VmaAllocation alloc)
{
    if(ctx && buffer != VK_NULL_HANDLE && buffer != buf)
    {
        const device& dev = ctx->get_device();
        ctx->at_frame_finish([
            buffer=buffer,
            allocation=allocation,
            allocator=dev.allocator
        ](){
            vmaDestroyBuffer(allocator, buffer, allocation);
        });
    }
    buffer = buf;
    allocation = alloc;
}

vkres<VkBuffer>& vkres<VkBuffer>::operator=(vkres<VkBuffer>&& other)
{
    reset(other.buffer, other.allocation);
    ctx = other.ctx;
    other.buffer = VK_NULL_HANDLE;
    other.allocation = VK_NULL_HANDLE;
    return *this;
}

const VkBuffer& vkres<VkBuffer>::operator*() const
{
    return buffer;
}

vkres<VkBuffer>::operator VkBuffer() const
{
    return buffer;
}

VmaAllocation vkres<VkBuffer>::get_allocation() const
{
    return allocation;
}

vkres<VkImage>::vkres()
: image(VK_NULL_HANDLE), allocation(VK_NULL_HANDLE), ctx(nullptr)
{
}

vkres<VkImage>::vkres(context& ctx, VkImage img, VmaAllocation alloc)
: image(img), allocation(alloc), ctx(&ctx)
{
}

vkres<VkImage>::vkres(vkres<VkImage>&& other)
: image(other.image), allocation(other.allocation), ctx(other.ctx)
{
    other.image = VK_NULL_HANDLE;
    other.allocation = VK_NULL_HANDLE;
}

vkres<VkImage>::~vkres()
{
    reset();
}

void vkres<VkImage>::reset(VkImage img, VmaAllocation alloc)
{
    if(ctx && image != VK_NULL_HANDLE && image != img)
    {
        const device& dev = ctx->get_device();
        ctx->at_frame_finish([
            image=image,
            allocation=allocation,
            allocator=dev.allocator
        ](){
            vmaDestroyImage(allocator, image, allocation);
        });
    }
    image = img;
    allocation = alloc;
}

vkres<VkImage>& vkres<VkImage>::operator=(vkres<VkImage>&& other)
{
    reset(other.image, other.allocation);
    ctx = other.ctx;
    other.image = VK_NULL_HANDLE;
    other.allocation = VK_NULL_HANDLE;
    return *this;
}

const VkImage& vkres<VkImage>::operator*() const
{
    return image;
}

vkres<VkImage>::operator VkImage() const
{
    return image;
}

VmaAllocation vkres<VkImage>::get_allocation() const
{
    return allocation;
}

template class vkres<VkDescriptorPool>;
template class vkres<VkFramebuffer>;
template class vkres<VkImageView>;
template class vkres<VkRenderPass>;
template class vkres<VkSampler>;
template class vkres<VkSemaphore>;
