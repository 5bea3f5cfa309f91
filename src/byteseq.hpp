#ifndef H_SUFTREE_BYTESEQ
#define H_SUFTREE_BYTESEQ

#include <stdint.h>
#include <string.h>
#include <vector>
#include <string>
#include <initializer_list>
#include <memory>
#include <stdexcept>

class IByteSequence {
    public:
        virtual ~IByteSequence() {}

        virtual size_t size() const = 0;
        virtual const uint8_t *buffer() const { return nullptr; }

        virtual int compare(const IByteSequence &seq, size_t this_off, size_t seq_off, size_t size) const {
            const uint8_t *this_buf = buffer(), *seq_buf = seq.buffer();
            if( this_buf &&  seq_buf) return memcmp(this_buf + this_off, seq_buf + seq_off, size);
            if( this_buf && !seq_buf) return -seq.compare(this_buf + this_off, seq_off, size);
            if(!this_buf &&  seq_buf) return compare(seq_buf + seq_off, this_off, size);

            for(size_t i = 0; i < size; i++) {
                if((*this)[this_off + i] != seq[seq_off + i]) return ((*this)[this_off + i] < seq[seq_off + i]) ? -1 : 1;
            }
            return 0;
        }

        virtual int compare(const uint8_t *buf, size_t off, size_t size) const {
            const uint8_t *this_buf = buffer();
            if(this_buf) return memcmp(this_buf + off, buf, size);

            for(size_t i = 0; i < size; i++) {
                if((*this)[off + i] != buf[i]) return ((*this)[off + i] < buf[i]) ? -1 : 1;
            }
            return 0;
        }

        virtual void get_data(uint8_t *buf, size_t off, size_t size) const = 0;
        virtual uint8_t operator [](size_t off) const = 0;

        std::string substr(size_t off, size_t size) const {
            std::string str(size, '\0');
            if(size > 0) get_data((uint8_t*) &str[0], off, size);
            return str;
        }
};

class CSequentialByteSequence : public IByteSequence {
    public:
        CSequentialByteSequence() : m_Size(0) {}
        CSequentialByteSequence(CSequentialByteSequence&& seq) : m_Size(seq.m_Size), m_Sequences(std::move(seq.m_Sequences)) { seq.m_Size = 0; }
        CSequentialByteSequence(const CSequentialByteSequence& seq) = delete;

        inline void add_sequence(IByteSequence *ptr) {
            m_Sequences.push_back(SSeqEntry(m_Size, ptr));
            m_Size += ptr->size();
        }

        template<typename SeqType, typename... Args> inline SeqType& emplace_sequence(Args&&... args) {
            SeqType *seq = new SeqType(std::forward<Args>(args)...);
            add_sequence(seq);
            return *seq;
        }

        virtual size_t size() const override { return m_Size; };

        using IByteSequence::compare;
        virtual int compare(const uint8_t *buf, size_t off, size_t size) const override;
        virtual void get_data(uint8_t *buf, size_t off, size_t size) const override;

        inline virtual uint8_t operator [](size_t off) const override {
            const SSeqEntry& ent = get_sequence(off);
            return (*ent.seq)[off - ent.off];
        }

    private:
        struct SSeqEntry {
            size_t off;
            std::unique_ptr<IByteSequence> seq;

            SSeqEntry(size_t off, IByteSequence *seq) : off(off), seq(seq) {}
        };

        const SSeqEntry& get_sequence(size_t off) const;

        size_t m_Size;
        std::vector<SSeqEntry> m_Sequences;
};

class CFillSequence : public IByteSequence {
    public:
        CFillSequence(size_t size, uint8_t fill) : m_Size(size), m_Fill(fill) {}

        virtual size_t size() const override { return m_Size; };
        virtual void get_data(uint8_t *buf, size_t off, size_t size) const override { memset(buf, m_Fill, size); }
        inline virtual uint8_t operator [](size_t off) const override { return m_Fill; }

    private:
        size_t m_Size;
        uint8_t m_Fill;
};

class CBufferSequence : public IByteSequence {
    public:
        CBufferSequence(const uint8_t *data, size_t size) : m_Data(data), m_Size(size) {}

        virtual size_t size() const override { return m_Size; };
        virtual const uint8_t *buffer() const override { return m_Data; };
        virtual void get_data(uint8_t *buf, size_t off, size_t size) const override { memcpy(buf, m_Data+off, size); }
        virtual uint8_t operator [](size_t off) const override { return m_Data[off]; }

    private:
        const uint8_t *m_Data;
        size_t m_Size;
};

class CVectorSequence : public IByteSequence {
    public:
        CVectorSequence() {}
        CVectorSequence(std::vector<uint8_t> data) : m_Data(std::move(data)) {}
        CVectorSequence(std::initializer_list<uint8_t> data) : m_Data(data) {}

        virtual size_t size() const override { return m_Data.size(); };
        virtual const uint8_t *buffer() const override { return m_Data.data(); };
        virtual void get_data(uint8_t *buf, size_t off, size_t size) const override { memcpy(buf, m_Data.data()+off, size); }
        virtual uint8_t operator [](size_t off) const override { return m_Data[off]; }

    private:
        std::vector<uint8_t> m_Data;
};

class CHexSequence : public IByteSequence {
    public:
        CHexSequence(const char *hexstr);

        virtual size_t size() const override { return m_Data.size(); };
        virtual const uint8_t *buffer() const override { return m_Data.data(); };
        virtual void get_data(uint8_t *buf, size_t off, size_t size) const override { memcpy(buf, m_Data.data()+off, size); }
        virtual uint8_t operator [](size_t off) const override { return m_Data[off]; }

    private:
        std::vector<uint8_t> m_Data;
};

class CStringSequence : public IByteSequence {
    public:
        CStringSequence(const char *str) : m_String(str), m_Size(strlen(str)) {}
        CStringSequence(const char *str, size_t size) : m_String(str), m_Size(size) {}

        virtual size_t size() const override { return m_Size; };
        virtual const uint8_t *buffer() const override { return (const uint8_t*) m_String; };
        virtual void get_data(uint8_t *buf, size_t off, size_t size) const override { memcpy(buf, m_String+off, size); }
        virtual uint8_t operator [](size_t off) const override { return (uint8_t) m_String[off]; }

    private:
        const char *m_String;
        size_t m_Size;
};

#endif
